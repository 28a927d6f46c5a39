// tlc/sema/types/type_utils.hpp - Type equality and rendering
//
#pragma once

#include <string>

#include "tlc/sema/types/type.hpp"

namespace tlc
{

/**
 * Structural equality of two types.
 *
 * - Int and Bool equal only themselves.
 * - Function types are equal iff inputs and outputs are equal.
 * - Linear types are equal iff their bases are equal.
 * - Effectful types are equal iff effect labels and bases are equal.
 *
 * Dependent function types are outside the relation: any comparison
 * involving one yields false. Null never equals anything.
 *
 * Does not rely on interning, so types from different TypeContexts compare
 * correctly.
 */
[[nodiscard]] bool types_equal(const Type * lhs, const Type * rhs);

/**
 * Convert a Type to its string representation.
 *
 * @return e.g. "Int", "(Int -> Bool)", "Linear[Int]", "Effect[IO, Int]",
 *         "(Pi n: Int. Effect[n, Int])"
 */
[[nodiscard]] std::string to_string(const Type * type);

/// Display name of a type kind ("Function", "Linear", ...)
[[nodiscard]] const char * to_string(TypeKind kind) noexcept;

}  // namespace tlc
