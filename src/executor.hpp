#pragma once

// Process-global Taskflow executor.
//
// SessionRegistry runs agent invocations here so that a slow agent never
// blocks the caller that submitted the query.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace coedit_cpp::detail {

// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace coedit_cpp::detail
