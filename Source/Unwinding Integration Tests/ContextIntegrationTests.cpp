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

#include "PLUnwindCatchTest.hpp"

#include "ArmContext.hpp"
#include "ContextTest.hpp"

#ifdef __arm__

PLUW_CPP_BEGIN_ARM_NS

/* Deterministic pseudo-random register values */
static uint32_t next_pattern (uint32_t *state) {
    *state = (*state * 1103515245) + 12345;
    return *state;
}

TEST_CASE("ARM context capture") {
    WHEN("Capturing a known register pattern") {
        plunwind_arm_regs_t regs;
        plunwind_async_memset(&regs, 0xFF, sizeof(regs));

        uint32_t vfp_pattern[16];
        for (size_t i = 0; i < 16; i++)
            vfp_pattern[i] = 0x55550010 + i;

        uintptr_t sp = plunwind_test_capture_pattern(&regs, 0xAAAAAAA4, vfp_pattern);
        Context ctx(regs);

        THEN("r4-r11 hold the pattern") {
            for (plunwind_regnum_t i = 4; i <= 11; i++)
                REQUIRE(ctx[i] == 0xAAAAAAA4 + (i - 4));
        }

        THEN("The stack pointer and return address are recorded") {
            REQUIRE(ctx.sp() == sp);
            REQUIRE(ctx.ra() != 0);
        }

        THEN("Registers that are not callee-saved are zeroed") {
            for (plunwind_regnum_t i = 0; i <= 3; i++)
                REQUIRE(ctx[i] == 0);
            REQUIRE(ctx[12] == 0);
            REQUIRE(ctx.ip() == 0);
        }

#if PLUNWIND_ARM_VFP_SUPPORT
        THEN("s16-s31 hold the VFP pattern, and s0-s15 are zeroed") {
            for (plunwind_regnum_t i = 0; i < 16; i++)
                REQUIRE(ctx[PLUNWIND_ARM_DWARF_VFP_FIRST + i] == 0);
            for (plunwind_regnum_t i = 16; i < 32; i++)
                REQUIRE(ctx[PLUNWIND_ARM_DWARF_VFP_FIRST + i] == vfp_pattern[i - 16]);
        }
#endif
    }

    WHEN("Capturing from C++") {
        int local = 0;
        Context ctx(plunwind_arm_regs_capture());

        THEN("The stack pointer refers to the current stack") {
            uintptr_t addr = (uintptr_t) &local;
            REQUIRE(ctx.sp() != 0);
            REQUIRE(ctx.sp() - 4096 < addr);
            REQUIRE(addr < ctx.sp() + 4096);
        }
    }
}

TEST_CASE("ARM context restore") {
    WHEN("Restoring a known register pattern") {
        Context ctx;
        for (plunwind_regnum_t i = 4; i <= 11; i++)
            ctx[i] = 0xAAAAAAA4 + (i - 4);
#if PLUNWIND_ARM_VFP_SUPPORT
        for (plunwind_regnum_t i = 16; i < 32; i++)
            ctx[PLUNWIND_ARM_DWARF_VFP_FIRST + i] = 0x55550000 + i;
#endif

        plunwind_arm_regs_t regs = ctx.regs();
        plunwind_arm_regs_t resumed;
        plunwind_test_restore_resume(&regs, &resumed);
        Context live(resumed);

        THEN("Execution resumes at the target address with the pattern installed") {
            for (plunwind_regnum_t i = 4; i <= 11; i++)
                REQUIRE(live[i] == 0xAAAAAAA4 + (i - 4));
        }

        THEN("The stack pointer is installed") {
            REQUIRE(live.sp() == regs.r[PLUNWIND_ARM_DWARF_SP]);
        }

        THEN("Execution resumes in ARM state") {
            REQUIRE((live.ra() & 1) == 0);
        }

#if PLUNWIND_ARM_VFP_SUPPORT
        THEN("The callee-saved VFP registers are installed") {
            for (plunwind_regnum_t i = 16; i < 32; i++)
                REQUIRE(live[PLUNWIND_ARM_DWARF_VFP_FIRST + i] == 0x55550000 + i);
        }
#endif
    }

#if PLUNWIND_TEST_THUMB_RESUME
    WHEN("Restoring to a Thumb resumption address") {
        Context ctx;
        for (plunwind_regnum_t i = 4; i <= 11; i++)
            ctx[i] = 0xCCCCCCC4 + (i - 4);
#if PLUNWIND_ARM_VFP_SUPPORT
        for (plunwind_regnum_t i = 16; i < 32; i++)
            ctx[PLUNWIND_ARM_DWARF_VFP_FIRST + i] = 0x66660000 + i;
#endif

        plunwind_arm_regs_t regs = ctx.regs();
        plunwind_arm_regs_t resumed;
        plunwind_test_restore_resume_thumb(&regs, &resumed);
        Context live(resumed);

        THEN("The pc slot selects Thumb state") {
            REQUIRE((regs.r[PLUNWIND_ARM_DWARF_PC] & 1) == 1);
        }

        THEN("Execution resumes in Thumb state, with the pattern installed") {
            REQUIRE((live.ra() & 1) == 1);
            for (plunwind_regnum_t i = 4; i <= 11; i++)
                REQUIRE(live[i] == 0xCCCCCCC4 + (i - 4));
        }

        THEN("The stack pointer is installed") {
            REQUIRE(live.sp() == regs.r[PLUNWIND_ARM_DWARF_SP]);
        }

#if PLUNWIND_ARM_VFP_SUPPORT
        THEN("The callee-saved VFP registers are installed") {
            for (plunwind_regnum_t i = 16; i < 32; i++)
                REQUIRE(live[PLUNWIND_ARM_DWARF_VFP_FIRST + i] == 0x66660000 + i);
        }
#endif
    }
#endif /* PLUNWIND_TEST_THUMB_RESUME */

    WHEN("Restoring and re-capturing arbitrary register values") {
        uint32_t state = 0x1f2e3d4c;

        THEN("Every callee-saved register survives the round trip") {
            for (size_t round = 0; round < 16; round++) {
                Context ctx;
                for (plunwind_regnum_t i = 0; i < PLUNWIND_ARM_GP_COUNT; i++)
                    ctx[i] = next_pattern(&state);
#if PLUNWIND_ARM_VFP_SUPPORT
                for (plunwind_regnum_t i = 0; i < PLUNWIND_ARM_FP_COUNT; i++)
                    ctx[PLUNWIND_ARM_DWARF_VFP_FIRST + i] = next_pattern(&state);
#endif

                plunwind_arm_regs_t regs = ctx.regs();
                plunwind_arm_regs_t resumed;
                plunwind_test_restore_resume(&regs, &resumed);
                Context live(resumed);

                for (plunwind_regnum_t i = 4; i <= 11; i++)
                    REQUIRE(live[i] == ctx[i]);
                REQUIRE(live.sp() == regs.r[PLUNWIND_ARM_DWARF_SP]);
#if PLUNWIND_ARM_VFP_SUPPORT
                for (plunwind_regnum_t i = 16; i < 32; i++)
                    REQUIRE(live[PLUNWIND_ARM_DWARF_VFP_FIRST + i] == ctx[PLUNWIND_ARM_DWARF_VFP_FIRST + i]);
#endif
            }
        }
    }
}

PLUW_CPP_END_ARM_NS

#endif /* __arm__ */
