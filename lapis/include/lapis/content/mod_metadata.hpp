#pragma once
#include <lapis/content/content_source.hpp>
#include <lapis/content/mod_summary.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <unordered_map>
#include <utility>

namespace lapis {
///
/// \brief Thread-safe cache of parsed mod metadata keyed by content hash, plus the provenance store.
///
/// Failed parses are cached too, so an unchanged unreadable file is not re-parsed on every reload.
///
class ModMetadataManager {
  public:
	///
	/// \param sources_file Path to the persisted provenance map (sources.json); empty disables persistence
	///
	explicit ModMetadataManager(std::filesystem::path sources_file = {});

	std::shared_ptr<ModSummary const> get_path(std::filesystem::path const& path);
	std::shared_ptr<ModSummary const> get_bytes(std::span<std::byte const> bytes);
	std::shared_ptr<ModSummary const> get_bytes(std::span<std::byte const> bytes, Sha1Digest const& hash);

	///
	/// \brief Record provenance (first writer per hash wins) and persist.
	///
	void set_content_sources(std::span<std::pair<Sha1Digest, ContentSource> const> sources);
	ContentSource content_source(Sha1Digest const& hash) const;

	///
	/// \brief Parse an archive's metadata without touching the cache.
	///
	static std::shared_ptr<ModSummary const> parse(std::span<std::byte const> bytes, Sha1Digest const& hash);

  private:
	void load_sources();
	void save_sources() const;

	std::filesystem::path m_sources_file{};
	std::unordered_map<Sha1Digest, std::shared_ptr<ModSummary const>, Sha1DigestHasher> m_summaries{};
	std::unordered_map<Sha1Digest, ContentSource, Sha1DigestHasher> m_sources{};
	mutable std::mutex m_mutex{};
};
} // namespace lapis
