#pragma once

namespace lapis {
///
/// \brief Mixin for types that hand out pointers to themselves (threads, OS handles, loader callbacks).
///
/// Declaring the copy operations deleted also suppresses the implicit moves.
///
class Pinned {
  public:
	Pinned(Pinned const&) = delete;
	Pinned& operator=(Pinned const&) = delete;

  protected:
	Pinned() = default;
	~Pinned() = default;
};
} // namespace lapis
