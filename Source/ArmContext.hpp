/*
 * Copyright (c) 2015 Plausible Labs Cooperative, Inc.
 * All rights reserved.
 *
 * Permission is hereby granted, free of charge, to any person
 * obtaining a copy of this software and associated documentation
 * files (the "Software"), to deal in the Software without
 * restriction, including without limitation the rights to use,
 * copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the
 * Software is furnished to do so, subject to the following
 * conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
 * OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
 * HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,
 * WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
 * FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
 * OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef PLUNWIND_ARM_CONTEXT_HPP
#define PLUNWIND_ARM_CONTEXT_HPP 1

#include <stddef.h>
#include <stdint.h>

#include "PLUnwindAsync.h"
#include "PLUnwindAsyncFile.hpp"
#include "PLUnwindContext_arm.h"

/**
 * @internal
 * @ingroup plunwind_arm
 * @{
 */

PLUW_CPP_BEGIN_ARM_NS

/**
 * The storage slot selected by a DWARF register number. Register numbers are partitioned into two
 * disjoint ranges; anything outside of those ranges resolves to an invalid slot.
 */
class RegisterSlot {
public:
    /** Register bank backing a slot. */
    typedef enum {
        /** General purpose registers, r0-r15 */
        BANK_GENERAL = 0,

        /** VFP registers, DWARF d0-d31 */
        BANK_FLOAT = 1,

        /** The register number is not supported by this target. */
        BANK_INVALID = 2
    } Bank;

    static RegisterSlot resolve (plunwind_regnum_t regnum);

    /** Return the bank containing this slot. */
    Bank bank (void) const { return _bank; }

    /** Return the slot's index within its bank. Undefined for BANK_INVALID slots. */
    size_t index (void) const { return _index; }

    /** Return true if the register number resolved to a storage slot. */
    bool isValid (void) const { return _bank != BANK_INVALID; }

private:
    RegisterSlot (Bank bank, size_t index) : _bank(bank), _index(index) {}

    /** Backing bank */
    Bank _bank;

    /** Index within @a _bank */
    size_t _index;
};

/**
 * ARM execution context.
 *
 * A context is either zero-initialized, or populated from a register set recorded by
 * plunwind_arm_regs_capture(). As CFI rules are applied, each frame's context is derived from a
 * copy of its predecessor; copies never share storage.
 *
 * Instances are owned by a single unwinding pass, and must not be shared between threads.
 */
class Context {
public:
    Context (void);
    explicit Context (const plunwind_arm_regs_t &regs);

    static size_t registerCount (void);
    static const char *registerName (plunwind_regnum_t regnum);

    plunwind_arm_greg_t &operator[] (plunwind_regnum_t regnum);
    const plunwind_arm_greg_t &operator[] (plunwind_regnum_t regnum) const;

    bool hasRegister (plunwind_regnum_t regnum) const;
    plunwind_error_t getRegister (plunwind_regnum_t regnum, plunwind_arm_greg_t *value) const;
    plunwind_error_t setRegister (plunwind_regnum_t regnum, plunwind_arm_greg_t value);

    /** Return the instruction pointer (pc). */
    plunwind_arm_greg_t ip (void) const { return _regs.r[PLUNWIND_ARM_DWARF_PC]; }

    /** Return the stack pointer. */
    plunwind_arm_greg_t sp (void) const { return _regs.r[PLUNWIND_ARM_DWARF_SP]; }

    /** Return the return address (lr). */
    plunwind_arm_greg_t ra (void) const { return _regs.r[PLUNWIND_ARM_DWARF_LR]; }

    void setIP (plunwind_arm_greg_t value) { _regs.r[PLUNWIND_ARM_DWARF_PC] = value; }
    void setSP (plunwind_arm_greg_t value) { _regs.r[PLUNWIND_ARM_DWARF_SP] = value; }
    void setRA (plunwind_arm_greg_t value) { _regs.r[PLUNWIND_ARM_DWARF_LR] = value; }

    /** Return a borrowed reference to the raw register set. */
    const plunwind_arm_regs_t &regs (void) const { return _regs; }

    plunwind_error_t write (async::AsyncFile *file) const;

#ifdef __arm__
    PLUW_NORETURN void restore (void) const;
#endif

private:
    plunwind_arm_greg_t *slot (plunwind_regnum_t regnum);

    /** Register storage. Must remain the only data member. */
    plunwind_arm_regs_t _regs;
};

/**
 * Iterates the registers of a Context, in the order r0-r12, sp, lr, pc, followed by d0-d31
 * when VFP support is enabled. The iterator performs no allocation, and the target context
 * must be non-NULL and outlive the iterator.
 */
class RegisterIterator {
public:
    RegisterIterator (const Context *context);
    bool next (plunwind_regnum_t *regnum, const char **name, plunwind_arm_greg_t *value);

private:
    /** Borrowed reference to the target context */
    const Context *_context;

    /** Position of the next register to be returned */
    size_t _pos;
};

PLUW_CPP_END_ARM_NS

/**
 * @}
 */

#endif /* PLUNWIND_ARM_CONTEXT_HPP */
