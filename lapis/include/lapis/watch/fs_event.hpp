#pragma once
#include <lapis/util/ptr.hpp>
#include <lapis/watch/raw_event.hpp>
#include <functional>
#include <optional>
#include <span>

namespace lapis {
namespace fs_event {
struct Changed {
	std::filesystem::path path{};
	bool maybe_file{};
	bool maybe_folder{};

	bool operator==(Changed const&) const = default;
};

struct Remove {
	std::filesystem::path path{};

	bool operator==(Remove const&) const = default;
};

struct Rename {
	std::filesystem::path from{};
	std::filesystem::path to{};

	bool operator==(Rename const&) const = default;
};
} // namespace fs_event

///
/// \brief Canonical filesystem event alphabet consumed by the router.
///
using FsEvent = std::variant<fs_event::Changed, fs_event::Remove, fs_event::Rename>;

///
/// \brief Path of a Changed or Remove event; Rename has none.
///
Ptr<std::filesystem::path const> changed_or_removed_path(FsEvent const& event);

///
/// \brief Reduce a raw notification to the canonical alphabet.
/// \returns std::nullopt for kinds that carry no useful information
///
std::optional<FsEvent> classify(RawEvent const& raw);

///
/// \brief Classify a batch and invoke handler once per coalesced event, in order.
///
/// Adjacent events sharing the same changed-or-removed path collapse into the later one.
/// \returns Number of handler invocations
///
std::size_t for_each_coalesced(std::span<RawEvent const> batch, std::function<void(FsEvent const&)> const& handler);
} // namespace lapis
