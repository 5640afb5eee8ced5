#pragma once

#include <expected>
#include <utility>

namespace wavepack::core {

/**
 * @brief Assign-or-return helper
 *
 * Usage:
 *   WAVEPACK_TRY_ASSIGN(value, some_expected_result);
 * Expands to:
 *   auto tmp = some_expected_result;
 *   if (!tmp) return std::unexpected(tmp.error());
 *   value = std::move(tmp.value());
 */
#define WAVEPACK_TRY_ASSIGN(lhs, expr)                                                        \
    do {                                                                                      \
        auto wavepack_try_tmp = (expr);                                                       \
        if (!wavepack_try_tmp)                                                                \
            return std::unexpected(wavepack_try_tmp.error());                                 \
        lhs = std::move(wavepack_try_tmp.value());                                            \
    } while (0)

/**
 * @brief Void-or-return helper
 *
 * Usage: WAVEPACK_TRY_VOID(some_void_expected_result);
 */
#define WAVEPACK_TRY_VOID(expr)                                                               \
    do {                                                                                      \
        auto wavepack_try_tmp_void = (expr);                                                  \
        if (!wavepack_try_tmp_void)                                                           \
            return std::unexpected(wavepack_try_tmp_void.error());                            \
    } while (0)

} // namespace wavepack::core
