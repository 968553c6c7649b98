// backend.hpp - process-wide choice of context-switch backend
//
// SPDX-License-Identifier: MIT OR Unlicense

#pragma once

#include "symco/context.hpp"
#include "symco/ucontext.hpp"

#ifdef SYMCO_USE_BOOST_CONTEXT
#include "symco/fcontext.hpp"
#endif

namespace symco
{
#ifdef SYMCO_USE_BOOST_CONTEXT
    using default_resumer = fcontext_resumer;
#else
    using default_resumer = ucontext_resumer;
#endif

    static_assert(resumer<ucontext_resumer>);
    static_assert(resumer<default_resumer>);
} // namespace symco
