#pragma once

namespace lapis {
///
/// \brief Alias for a single (nullable, non-owning) pointer.
///
/// Using Ptr<T> for anything except "pointer to T" is undefined behavior (eg pointer arithmetic).
///
template <typename T>
using Ptr = T*;
} // namespace lapis
