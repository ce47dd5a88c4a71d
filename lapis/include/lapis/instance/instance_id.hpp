#pragma once
#include <lapis/util/generational_arena.hpp>

namespace lapis {
struct InstanceTag;
struct ModTag;

///
/// \brief Handle to a live instance; null_v index denotes a not-yet-registered instance.
///
using InstanceID = GenerationalId<InstanceTag>;

///
/// \brief Handle to a mod in an instance's current mod snapshot.
///
/// The generation is the instance's mod generation at publish time.
///
using ModID = GenerationalId<ModTag>;
} // namespace lapis
