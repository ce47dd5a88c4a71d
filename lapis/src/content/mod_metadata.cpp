#include <djson/json.hpp>
#include <lapis/content/mod_metadata.hpp>
#include <lapis/io/file.hpp>
#include <lapis/io/zip_archive.hpp>
#include <lapis/util/logger.hpp>
#include <optional>
#include <string>

namespace lapis {
namespace {
namespace fs = std::filesystem;

auto const g_log{Logger{"ModMetadata"}};

std::string_view trim(std::string_view text) {
	while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\r')) { text.remove_prefix(1); }
	while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) { text.remove_suffix(1); }
	return text;
}

void append_author(std::string& out, std::string_view const author) {
	if (author.empty()) { return; }
	if (!out.empty()) { out += ", "; }
	out += author;
}

std::optional<ModSummary> from_fabric(dj::Json const& json) {
	auto ret = ModSummary{};
	ret.id = json["id"].as<std::string>();
	if (ret.id.empty()) { return {}; }
	ret.name = json["name"].as<std::string>(ret.id);
	ret.version = json["version"].as<std::string>();
	for (auto const& author : json["authors"].array_view()) {
		// either "name" or {"name": "..."}
		if (author.is_object()) {
			append_author(ret.authors, author["name"].as_string());
		} else {
			append_author(ret.authors, author.as_string());
		}
	}
	return ret;
}

std::optional<ModSummary> from_quilt(dj::Json const& json) {
	auto const& loader = json["quilt_loader"];
	auto ret = ModSummary{};
	ret.id = loader["id"].as<std::string>();
	if (ret.id.empty()) { return {}; }
	auto const& metadata = loader["metadata"];
	ret.name = metadata["name"].as<std::string>(ret.id);
	ret.version = loader["version"].as<std::string>();
	for (auto const& [name, _] : metadata["contributors"].object_view()) { append_author(ret.authors, name); }
	return ret;
}

std::optional<ModSummary> from_mcmod_info(dj::Json const& json) {
	auto const& list = json.is_array() ? json : json["modList"];
	for (auto const& mod : list.array_view()) {
		auto ret = ModSummary{};
		ret.id = mod["modid"].as<std::string>();
		if (ret.id.empty()) { return {}; }
		ret.name = mod["name"].as<std::string>(ret.id);
		ret.version = mod["version"].as<std::string>();
		for (auto const& author : mod["authorList"].array_view()) { append_author(ret.authors, author.as_string()); }
		return ret;
	}
	return {};
}

std::string_view toml_value(std::string_view value) {
	value = trim(value);
	if (value.starts_with("\"\"\"") || value.starts_with("'''")) { return trim(value.substr(3)); }
	if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
		auto const quote = value.front();
		value.remove_prefix(1);
		return value.substr(0, value.find(quote));
	}
	return value.substr(0, value.find('#'));
}

// reads the first [[mods]] table of a Forge / NeoForge mods.toml
std::optional<ModSummary> from_mods_toml(std::string_view text) {
	auto ret = ModSummary{};
	auto in_mods = false;
	while (!text.empty()) {
		auto const newline = text.find('\n');
		auto const line = trim(text.substr(0, newline));
		text = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);
		if (line.empty() || line.front() == '#') { continue; }
		if (line.starts_with("[[mods]]")) {
			if (in_mods) { break; }
			in_mods = true;
			continue;
		}
		if (line.front() == '[') {
			if (in_mods) { break; }
			continue;
		}
		auto const eq = line.find('=');
		if (eq == std::string_view::npos) { continue; }
		auto const key = trim(line.substr(0, eq));
		auto const value = toml_value(line.substr(eq + 1));
		if (key == "authors") {
			ret.authors = std::string{value};
			continue;
		}
		if (!in_mods) { continue; }
		if (key == "modId") {
			ret.id = value;
		} else if (key == "displayName") {
			ret.name = value;
		} else if (key == "version") {
			ret.version = value;
		}
	}
	if (ret.id.empty()) { return {}; }
	if (ret.name.empty()) { ret.name = ret.id; }
	// resolved from the jar manifest at build time; not meaningful here
	if (ret.version.starts_with("${")) { ret.version.clear(); }
	return ret;
}

std::optional<ModSummary> from_mrpack(dj::Json const& json) {
	auto ret = ModSummary{};
	ret.name = json["name"].as<std::string>();
	if (ret.name.empty()) { return {}; }
	ret.id = ret.name;
	ret.version = json["versionId"].as<std::string>();
	auto manifest = ModpackManifest{};
	manifest.game_version = json["dependencies"]["minecraft"].as<std::string>();
	for (auto const& in_file : json["files"].array_view()) {
		auto file = ModpackFile{};
		file.path = in_file["path"].as<std::string>();
		file.sha1 = in_file["hashes"]["sha1"].as<std::string>();
		file.size = in_file["fileSize"].as<std::uint64_t>();
		for (auto const& url : in_file["downloads"].array_view()) { file.urls.emplace_back(url.as_string()); }
		if (file.path.empty() || file.sha1.empty() || file.urls.empty()) {
			g_log.debug("Skipping incomplete modpack entry [{}]", file.path);
			continue;
		}
		manifest.files.push_back(std::move(file));
	}
	ret.modpack = std::move(manifest);
	return ret;
}

std::optional<ModSummary> parse_archive(ZipArchive const& archive) {
	if (auto text = archive.read_text("modrinth.index.json")) { return from_mrpack(dj::Json::parse(*text)); }
	if (auto text = archive.read_text("fabric.mod.json")) { return from_fabric(dj::Json::parse(*text)); }
	if (auto text = archive.read_text("quilt.mod.json")) { return from_quilt(dj::Json::parse(*text)); }
	if (auto text = archive.read_text("META-INF/mods.toml")) { return from_mods_toml(*text); }
	if (auto text = archive.read_text("META-INF/neoforge.mods.toml")) { return from_mods_toml(*text); }
	if (auto text = archive.read_text("mcmod.info")) { return from_mcmod_info(dj::Json::parse(*text)); }
	return {};
}
} // namespace

ModMetadataManager::ModMetadataManager(fs::path sources_file) : m_sources_file(std::move(sources_file)) { load_sources(); }

std::shared_ptr<ModSummary const> ModMetadataManager::parse(std::span<std::byte const> bytes, Sha1Digest const& hash) {
	auto const archive = ZipArchive::open(bytes);
	if (!archive) { return {}; }
	auto summary = parse_archive(*archive);
	if (!summary) { return {}; }
	summary->sha1 = hash;
	return std::make_shared<ModSummary const>(std::move(*summary));
}

std::shared_ptr<ModSummary const> ModMetadataManager::get_path(fs::path const& path) {
	auto const bytes = file::read_bytes(path);
	if (!bytes) {
		g_log.warn("Failed to read [{}]", path.generic_string());
		return {};
	}
	auto ret = get_bytes(*bytes);
	if (!ret) { g_log.debug("No mod metadata in [{}]", path.generic_string()); }
	return ret;
}

std::shared_ptr<ModSummary const> ModMetadataManager::get_bytes(std::span<std::byte const> bytes) { return get_bytes(bytes, sha1_of(bytes)); }

std::shared_ptr<ModSummary const> ModMetadataManager::get_bytes(std::span<std::byte const> bytes, Sha1Digest const& hash) {
	auto lock = std::unique_lock{m_mutex};
	if (auto const it = m_summaries.find(hash); it != m_summaries.end()) { return it->second; }
	lock.unlock();
	auto ret = parse(bytes, hash);
	lock.lock();
	m_summaries.insert_or_assign(hash, ret);
	return ret;
}

void ModMetadataManager::set_content_sources(std::span<std::pair<Sha1Digest, ContentSource> const> sources) {
	auto lock = std::scoped_lock{m_mutex};
	auto changed = false;
	for (auto const& [hash, source] : sources) { changed |= m_sources.insert({hash, source}).second; }
	if (changed) { save_sources(); }
}

ContentSource ModMetadataManager::content_source(Sha1Digest const& hash) const {
	auto lock = std::scoped_lock{m_mutex};
	if (auto const it = m_sources.find(hash); it != m_sources.end()) { return it->second; }
	return ContentSource::eManual;
}

void ModMetadataManager::load_sources() {
	auto ec = std::error_code{};
	if (m_sources_file.empty() || !fs::is_regular_file(m_sources_file, ec)) { return; }
	auto const json = dj::Json::from_file(m_sources_file.string().c_str());
	if (!json) {
		g_log.warn("Failed to parse [{}]", m_sources_file.generic_string());
		return;
	}
	for (auto const& [hex, in_source] : json.object_view()) {
		auto const hash = parse_sha1_hex(hex);
		auto const source = parse_content_source(in_source.as_string());
		if (!hash || !source) { continue; }
		m_sources.insert_or_assign(*hash, *source);
	}
	g_log.debug("Loaded {} content sources", m_sources.size());
}

// requires lock
void ModMetadataManager::save_sources() const {
	if (m_sources_file.empty()) { return; }
	auto json = dj::Json{};
	for (auto const& [hash, source] : m_sources) { json[to_hex(hash)] = std::string{to_string(source)}; }
	if (!file::write_text(m_sources_file, dj::to_string(json))) { g_log.warn("Failed to write [{}]", m_sources_file.generic_string()); }
}
} // namespace lapis
