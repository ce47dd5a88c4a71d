#include <lapis/util/logger.hpp>
#include <lapis/util/visitor.hpp>
#include <lapis/watch/fs_event.hpp>

namespace lapis {
namespace {
auto const g_log{Logger{"Classifier"}};

using Result = std::optional<FsEvent>;

Result changed(RawEvent const& raw, bool const maybe_file, bool const maybe_folder) {
	if (raw.paths.empty()) {
		g_log.debug("Dropping event without path");
		return {};
	}
	return fs_event::Changed{raw.paths.front(), maybe_file, maybe_folder};
}

Result remove(RawEvent const& raw) {
	if (raw.paths.empty()) {
		g_log.debug("Dropping removal without path");
		return {};
	}
	return fs_event::Remove{raw.paths.front()};
}

Result rename(RawEvent const& raw) {
	if (raw.paths.size() < 2) {
		g_log.debug("Dropping rename with {} path(s)", raw.paths.size());
		return {};
	}
	return fs_event::Rename{raw.paths[0], raw.paths[1]};
}

Result classify_create(RawEvent const& raw, raw::CreateKind const kind) {
	switch (kind) {
	case raw::CreateKind::eFile: return changed(raw, true, false);
	case raw::CreateKind::eFolder: return changed(raw, false, true);
	case raw::CreateKind::eAny: return changed(raw, true, true);
	default: return {};
	}
}

Result classify_name(RawEvent const& raw, raw::RenameMode const mode) {
	switch (mode) {
	case raw::RenameMode::eTo: return changed(raw, true, true);
	case raw::RenameMode::eFrom: return remove(raw);
	case raw::RenameMode::eBoth: return rename(raw);
	default: return {};
	}
}
} // namespace

Ptr<std::filesystem::path const> changed_or_removed_path(FsEvent const& event) {
	auto const visitor = Visitor{
		[](fs_event::Changed const& c) -> Ptr<std::filesystem::path const> { return &c.path; },
		[](fs_event::Remove const& r) -> Ptr<std::filesystem::path const> { return &r.path; },
		[](fs_event::Rename const&) -> Ptr<std::filesystem::path const> { return nullptr; },
	};
	return std::visit(visitor, event);
}

std::optional<FsEvent> classify(RawEvent const& raw) {
	auto const visitor = Visitor{
		[&raw](raw::Create const& c) { return classify_create(raw, c.kind); },
		[&raw](raw::ModifyAny) { return changed(raw, true, true); },
		[&raw](raw::ModifyData const& d) {
			if (d.change == raw::DataChange::eAny || d.change == raw::DataChange::eContent) { return changed(raw, true, false); }
			return Result{};
		},
		[&raw](raw::ModifyName const& n) { return classify_name(raw, n.mode); },
		[&raw](raw::Remove const& r) {
			if (r.kind == raw::RemoveKind::eOther) { return Result{}; }
			return remove(raw);
		},
		[](auto const&) { return Result{}; },
	};
	return std::visit(visitor, raw.kind);
}

std::size_t for_each_coalesced(std::span<RawEvent const> batch, std::function<void(FsEvent const&)> const& handler) {
	auto ret = std::size_t{};
	auto previous = std::optional<FsEvent>{};
	for (auto const& raw : batch) {
		auto next = classify(raw);
		if (!next) { continue; }
		if (previous) {
			auto const* lhs = changed_or_removed_path(*previous);
			auto const* rhs = changed_or_removed_path(*next);
			if (!lhs || !rhs || *lhs != *rhs) {
				handler(*previous);
				++ret;
			}
		}
		previous = std::move(next);
	}
	if (previous) {
		handler(*previous);
		++ret;
	}
	return ret;
}
} // namespace lapis
