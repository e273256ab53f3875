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

/* NOTE: This file is included by pre-processed assembler files; prior to including
 * this header, PLUNWIND_CONTEXT_ASM must be defined. */

#ifndef PLUNWIND_CONTEXT_ARM_H
#define PLUNWIND_CONTEXT_ARM_H 1

/*
 * VFP register bank configuration. The bank is a static property of the build; it is
 * never detected at runtime. Unless explicitly configured, the bank is present whenever the
 * ARM target provides floating point hardware, and always present when the register model
 * is built for a non-ARM host.
 */
#ifndef PLUNWIND_ARM_VFP_SUPPORT
#  if defined(__arm__) && !defined(__ARM_FP)
#    define PLUNWIND_ARM_VFP_SUPPORT 0
#  else
#    define PLUNWIND_ARM_VFP_SUPPORT 1
#  endif
#endif

/*
 * Assembler-visible layout constants. These must match plunwind_arm_regs_t exactly; the
 * capture and restore primitives address the structure through these offsets.
 */

/** Size of a single register word, in bytes. */
#define PLUNWIND_ARM_GREG_SIZE          4

/** Number of general purpose register slots (r0-r15). */
#define PLUNWIND_ARM_GP_COUNT           16

/** Number of VFP register words (DWARF register numbers 256-287). */
#define PLUNWIND_ARM_FP_COUNT           32

#define PLUNWIND_ARM_CTX_GP_OFFSET      0
#define PLUNWIND_ARM_CTX_R4_OFFSET      16
#define PLUNWIND_ARM_CTX_R12_OFFSET     48
#define PLUNWIND_ARM_CTX_SP_OFFSET      52
#define PLUNWIND_ARM_CTX_LR_OFFSET      56
#define PLUNWIND_ARM_CTX_PC_OFFSET      60
#define PLUNWIND_ARM_CTX_FP_OFFSET      64

/** Offset of s16, the first callee-saved VFP word (d8). */
#define PLUNWIND_ARM_CTX_S16_OFFSET     128

#if PLUNWIND_ARM_VFP_SUPPORT
#define PLUNWIND_ARM_CTX_SIZE           192
#else
#define PLUNWIND_ARM_CTX_SIZE           64
#endif

/* C/C++ declarations */
#ifndef PLUNWIND_CONTEXT_ASM

#include <stdint.h>
#include "PLUnwindMacros.h"

/**
 * @internal
 * @ingroup plunwind_arm
 * @{
 */

/** ARM register word. The register model always uses 32-bit words, including when built for a 64-bit host. */
typedef uint32_t plunwind_arm_greg_t;

/** DWARF register number, as defined by the DWARF for the ARM Architecture ABI. */
typedef uint32_t plunwind_regnum_t;

/**
 * Number of CFI register rule columns an unwind rule table must provide for this target. This
 * matches DWARF_FRAME_REGISTERS as defined by libgcc.
 */
#define PLUNWIND_ARM_MAX_REG_RULES 107

/**
 * DWARF register numbers supported by the ARM register context.
 */
typedef enum {
    PLUNWIND_ARM_DWARF_R0 = 0,
    PLUNWIND_ARM_DWARF_R1,
    PLUNWIND_ARM_DWARF_R2,
    PLUNWIND_ARM_DWARF_R3,
    PLUNWIND_ARM_DWARF_R4,
    PLUNWIND_ARM_DWARF_R5,
    PLUNWIND_ARM_DWARF_R6,
    PLUNWIND_ARM_DWARF_R7,
    PLUNWIND_ARM_DWARF_R8,
    PLUNWIND_ARM_DWARF_R9,
    PLUNWIND_ARM_DWARF_R10,
    PLUNWIND_ARM_DWARF_R11,
    PLUNWIND_ARM_DWARF_R12,

    /** Stack pointer (r13) */
    PLUNWIND_ARM_DWARF_SP = 13,

    /** Link register (r14); the return address column */
    PLUNWIND_ARM_DWARF_LR = 14,

    /** Program counter (r15) */
    PLUNWIND_ARM_DWARF_PC = 15,

    /** First VFP register number (d0); selects VFP word 0 */
    PLUNWIND_ARM_DWARF_VFP_FIRST = 256,

    /** Last VFP register number (d31); selects VFP word 31 */
    PLUNWIND_ARM_DWARF_VFP_LAST = 287
} plunwind_arm_dwarf_regnum_t;

/**
 * Raw ARM register set.
 *
 * @warning The structure layout must be kept in sync with the PLUNWIND_ARM_CTX_* constants
 * above, which are used by PLUnwindContext_arm.S.
 */
typedef struct plunwind_arm_regs {
    /** General purpose registers r0-r15 */
    plunwind_arm_greg_t r[PLUNWIND_ARM_GP_COUNT];

#if PLUNWIND_ARM_VFP_SUPPORT
    /**
     * VFP register bank, one 32-bit word per DWARF register number 256-287 (d0-d31). Word n is
     * addressed by register number 256 + n.
     *
     * The bank holds 32 words, not 32 doubleword registers. Capture and restore transfer the
     * hardware registers s0-s31 word for word, so the callee-saved d8-d15 (s16-s31) occupy words
     * 16-31, which are addressed by register numbers 272-287. CFI rules for d8-d15 (columns 264-271)
     * address words 8-15 and do not reach the captured callee-saved values.
     */
    plunwind_arm_greg_t s[PLUNWIND_ARM_FP_COUNT];
#endif
} plunwind_arm_regs_t;

#ifdef __arm__

PLUW_C_BEGIN_DECLS

/**
 * Record the caller's callee-saved register state.
 *
 * The returned register set contains r4-r11, the caller's stack pointer, and the return address
 * (lr) into the caller. When VFP support is enabled, s16-s31 (d8-d15) are also recorded. All
 * other slots are zero.
 *
 * This function does not establish a stack frame, and does not modify any callee-saved register.
 * It must be called directly from the frame whose state is to be recorded; calling it through
 * a wrapper function records the wrapper's state instead.
 */
plunwind_arm_regs_t plunwind_arm_regs_capture (void);

/**
 * Install all registers from @a regs, and resume execution at the address held in the pc slot. ARM or
 * Thumb state is selected by bit 0 of that address.
 *
 * The caller must guarantee that no signal handler runs during the restore. This function never
 * returns.
 *
 * @param regs The register set to be installed. The memory is only read.
 */
PLUW_NORETURN void plunwind_arm_regs_restore (const plunwind_arm_regs_t *regs);

PLUW_C_END_DECLS

#endif /* __arm__ */

/**
 * @}
 */

#endif /* !PLUNWIND_CONTEXT_ASM */

#endif /* PLUNWIND_CONTEXT_ARM_H */
