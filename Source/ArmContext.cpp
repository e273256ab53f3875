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

#include "ArmContext.hpp"

#include <inttypes.h>

using namespace plunwind::arm;

/**
 * @internal
 * @ingroup plunwind_arm
 * @{
 */

/* The assembly primitives address the register set through these constants. */
PLUW_ASSERT_STATIC(greg_size, sizeof(plunwind_arm_greg_t) == PLUNWIND_ARM_GREG_SIZE);
PLUW_ASSERT_STATIC(gp_offset, offsetof(plunwind_arm_regs_t, r) == PLUNWIND_ARM_CTX_GP_OFFSET);
PLUW_ASSERT_STATIC(r4_offset, offsetof(plunwind_arm_regs_t, r[4]) == PLUNWIND_ARM_CTX_R4_OFFSET);
PLUW_ASSERT_STATIC(r12_offset, offsetof(plunwind_arm_regs_t, r[12]) == PLUNWIND_ARM_CTX_R12_OFFSET);
PLUW_ASSERT_STATIC(sp_offset, offsetof(plunwind_arm_regs_t, r[PLUNWIND_ARM_DWARF_SP]) == PLUNWIND_ARM_CTX_SP_OFFSET);
PLUW_ASSERT_STATIC(lr_offset, offsetof(plunwind_arm_regs_t, r[PLUNWIND_ARM_DWARF_LR]) == PLUNWIND_ARM_CTX_LR_OFFSET);
PLUW_ASSERT_STATIC(pc_offset, offsetof(plunwind_arm_regs_t, r[PLUNWIND_ARM_DWARF_PC]) == PLUNWIND_ARM_CTX_PC_OFFSET);
#if PLUNWIND_ARM_VFP_SUPPORT
PLUW_ASSERT_STATIC(fp_offset, offsetof(plunwind_arm_regs_t, s) == PLUNWIND_ARM_CTX_FP_OFFSET);
PLUW_ASSERT_STATIC(s16_offset, offsetof(plunwind_arm_regs_t, s[16]) == PLUNWIND_ARM_CTX_S16_OFFSET);
#endif
PLUW_ASSERT_STATIC(ctx_size, sizeof(plunwind_arm_regs_t) == PLUNWIND_ARM_CTX_SIZE);
PLUW_ASSERT_STATIC(ctx_wrapper_size, sizeof(Context) == sizeof(plunwind_arm_regs_t));

/** General purpose register names, indexed by DWARF register number. */
static const char *gp_register_names[PLUNWIND_ARM_GP_COUNT] = {
    "r0", "r1", "r2", "r3", "r4", "r5", "r6", "r7",
    "r8", "r9", "r10", "r11", "r12", "sp", "lr", "pc"
};

#if PLUNWIND_ARM_VFP_SUPPORT
/** VFP register names, indexed by (DWARF register number - 256). */
static const char *fp_register_names[PLUNWIND_ARM_FP_COUNT] = {
    "d0", "d1", "d2", "d3", "d4", "d5", "d6", "d7",
    "d8", "d9", "d10", "d11", "d12", "d13", "d14", "d15",
    "d16", "d17", "d18", "d19", "d20", "d21", "d22", "d23",
    "d24", "d25", "d26", "d27", "d28", "d29", "d30", "d31"
};
#endif

/**
 * Map a DWARF register number to its storage slot.
 *
 * Register numbers 0-15 select r0-r15. Register numbers 256-287 select VFP words 0-31; when
 * VFP support is disabled in the build, they are treated as unsupported. All other register numbers
 * resolve to an invalid slot.
 *
 * @param regnum The DWARF register number to resolve.
 */
RegisterSlot RegisterSlot::resolve (plunwind_regnum_t regnum) {
    if (regnum <= (plunwind_regnum_t) PLUNWIND_ARM_DWARF_PC)
        return RegisterSlot(BANK_GENERAL, regnum);

#if PLUNWIND_ARM_VFP_SUPPORT
    if (regnum >= (plunwind_regnum_t) PLUNWIND_ARM_DWARF_VFP_FIRST && regnum <= (plunwind_regnum_t) PLUNWIND_ARM_DWARF_VFP_LAST)
        return RegisterSlot(BANK_FLOAT, regnum - PLUNWIND_ARM_DWARF_VFP_FIRST);
#endif

    return RegisterSlot(BANK_INVALID, 0);
}

/**
 * Construct a context with all registers set to zero.
 */
Context::Context (void) {
    plunwind_async_memset(&_regs, 0, sizeof(_regs));
}

/**
 * Construct a context from a register set produced by plunwind_arm_regs_capture(), or by any
 * other writer that populates the full register set.
 *
 * @param regs The register set to be copied.
 */
Context::Context (const plunwind_arm_regs_t &regs) : _regs(regs) {}

/**
 * Return the total number of registers held by a context.
 */
size_t Context::registerCount (void) {
#if PLUNWIND_ARM_VFP_SUPPORT
    return PLUNWIND_ARM_GP_COUNT + PLUNWIND_ARM_FP_COUNT;
#else
    return PLUNWIND_ARM_GP_COUNT;
#endif
}

/**
 * Return the architectural name of @a regnum, or NULL if the register number is not supported.
 * The returned string is statically allocated.
 *
 * @param regnum The DWARF register number.
 */
const char *Context::registerName (plunwind_regnum_t regnum) {
    RegisterSlot slot = RegisterSlot::resolve(regnum);
    switch (slot.bank()) {
        case RegisterSlot::BANK_GENERAL:
            return gp_register_names[slot.index()];

        case RegisterSlot::BANK_FLOAT:
#if PLUNWIND_ARM_VFP_SUPPORT
            return fp_register_names[slot.index()];
#else
            break;
#endif

        case RegisterSlot::BANK_INVALID:
            break;
    }

    return NULL;
}

/**
 * Return a pointer to the storage backing @a regnum, or NULL if the register number does
 * not resolve to a slot.
 */
plunwind_arm_greg_t *Context::slot (plunwind_regnum_t regnum) {
    RegisterSlot slot = RegisterSlot::resolve(regnum);
    switch (slot.bank()) {
        case RegisterSlot::BANK_GENERAL:
            if (slot.index() < PLUNWIND_ARM_GP_COUNT)
                return &_regs.r[slot.index()];
            break;

        case RegisterSlot::BANK_FLOAT:
#if PLUNWIND_ARM_VFP_SUPPORT
            if (slot.index() < PLUNWIND_ARM_FP_COUNT)
                return &_regs.s[slot.index()];
#endif
            break;

        case RegisterSlot::BANK_INVALID:
            break;
    }

    return NULL;
}

/**
 * Return a reference to the register slot for @a regnum.
 *
 * An unsupported register number can only originate from a malformed or unsupported CFI rule;
 * continuing with a fabricated slot would corrupt the unwind. The process is terminated instead.
 * Callers that must handle unsupported register numbers should validate them with hasRegister().
 *
 * @param regnum The DWARF register number.
 */
plunwind_arm_greg_t &Context::operator[] (plunwind_regnum_t regnum) {
    plunwind_arm_greg_t *reg = slot(regnum);
    if (reg == NULL) {
        PLUW_FATAL("Unsupported ARM register number: %" PRIu32, regnum);
    }

    return *reg;
}

/**
 * Return a read-only reference to the register slot for @a regnum. Unsupported register numbers
 * terminate the process.
 *
 * @param regnum The DWARF register number.
 */
const plunwind_arm_greg_t &Context::operator[] (plunwind_regnum_t regnum) const {
    return (*const_cast<Context *>(this))[regnum];
}

/**
 * Return true if @a regnum is backed by a slot in this context.
 *
 * @param regnum The DWARF register number.
 */
bool Context::hasRegister (plunwind_regnum_t regnum) const {
    return RegisterSlot::resolve(regnum).isValid();
}

/**
 * Fetch a register value.
 *
 * @param regnum The DWARF register number.
 * @param value[out] On success, the register's value.
 *
 * @return Returns PLUNWIND_ESUCCESS on success, or PLUNWIND_EBADREG if @a regnum is unsupported.
 */
plunwind_error_t Context::getRegister (plunwind_regnum_t regnum, plunwind_arm_greg_t *value) const {
    const plunwind_arm_greg_t *reg = const_cast<Context *>(this)->slot(regnum);
    if (reg == NULL) {
        PLUW_DEBUG("Requested unsupported ARM register number %" PRIu32, regnum);
        return PLUNWIND_EBADREG;
    }

    *value = *reg;
    return PLUNWIND_ESUCCESS;
}

/**
 * Set a register value.
 *
 * @param regnum The DWARF register number.
 * @param value The new value.
 *
 * @return Returns PLUNWIND_ESUCCESS on success, or PLUNWIND_EBADREG if @a regnum is unsupported.
 */
plunwind_error_t Context::setRegister (plunwind_regnum_t regnum, plunwind_arm_greg_t value) {
    plunwind_arm_greg_t *reg = slot(regnum);
    if (reg == NULL) {
        PLUW_DEBUG("Attempted to set unsupported ARM register number %" PRIu32, regnum);
        return PLUNWIND_EBADREG;
    }

    *reg = value;
    return PLUNWIND_ESUCCESS;
}

/**
 * Write a textual register dump to @a file, one register per line, and flush the file.
 *
 * The dump is purely diagnostic; the context is not modified.
 *
 * @param file The output file.
 *
 * @return Returns PLUNWIND_ESUCCESS on success, or PLUNWIND_OUTPUT_ERR if writing to @a file fails.
 */
plunwind_error_t Context::write (async::AsyncFile *file) const {
    PLUW_ASSERT(file != NULL);

    RegisterIterator iter(this);
    plunwind_regnum_t regnum;
    const char *name;
    plunwind_arm_greg_t value;

    while (iter.next(&regnum, &name, &value)) {
        char line[32];
        int len = snprintf(line, sizeof(line), "%4s: 0x%08" PRIx32 "\n", name, value);
        if (len < 0 || (size_t) len >= sizeof(line)) {
            PLUW_DEBUG("Could not format register %" PRIu32, regnum);
            return PLUNWIND_EINTERNAL;
        }

        if (!file->write(line, len))
            return PLUNWIND_OUTPUT_ERR;
    }

    if (!file->flush())
        return PLUNWIND_OUTPUT_ERR;

    return PLUNWIND_ESUCCESS;
}

#ifdef __arm__
/**
 * Install this context's registers into the current thread and resume execution at its pc.
 *
 * All CFI rules must have been applied, and all register numbers validated, before calling
 * this method. It never returns.
 */
void Context::restore (void) const {
    plunwind_arm_regs_restore(&_regs);
}
#endif /* __arm__ */

/**
 * Construct an iterator over all registers of @a context.
 *
 * @param context The context to be iterated. This is a borrowed reference.
 */
RegisterIterator::RegisterIterator (const Context *context) : _context(context), _pos(0) {}

/**
 * Fetch the next register.
 *
 * @param regnum[out] The register's DWARF register number.
 * @param name[out] The register's architectural name.
 * @param value[out] The register's current value.
 *
 * @return Returns true if a register was returned, or false if iteration has completed.
 */
bool RegisterIterator::next (plunwind_regnum_t *regnum, const char **name, plunwind_arm_greg_t *value) {
    PLUW_ASSERT(_context != NULL);

    if (_pos >= Context::registerCount())
        return false;

    plunwind_regnum_t r;
    if (_pos < PLUNWIND_ARM_GP_COUNT) {
        r = (plunwind_regnum_t) _pos;
    } else {
        r = PLUNWIND_ARM_DWARF_VFP_FIRST + (plunwind_regnum_t) (_pos - PLUNWIND_ARM_GP_COUNT);
    }
    _pos++;

    *regnum = r;
    *name = Context::registerName(r);
    *value = (*_context)[r];
    return true;
}

/**
 * @}
 */
