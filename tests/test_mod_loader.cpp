#include <gtest/gtest.h>
#include <lapis/content/mod_metadata.hpp>
#include <lapis/instance/mod_loader.hpp>
#include <test_util.hpp>

namespace lapis {
namespace fs = std::filesystem;

namespace {
std::shared_ptr<ModSummary const> parse_zip(std::vector<std::pair<std::string, std::string>> const& entries) {
	auto const bytes = test::make_zip(entries);
	return ModMetadataManager::parse(bytes, sha1_of(bytes));
}
} // namespace

TEST(ModMetadata, Fabric) {
	auto const summary = parse_zip({{"fabric.mod.json", test::fabric_mod_json("sodium", "Sodium", "0.5.8")}});
	ASSERT_TRUE(summary);
	EXPECT_EQ(summary->id, "sodium");
	EXPECT_EQ(summary->name, "Sodium");
	EXPECT_EQ(summary->version, "0.5.8");
	EXPECT_EQ(summary->authors, "alice, bob");
	EXPECT_FALSE(summary->modpack);
}

TEST(ModMetadata, Quilt) {
	auto const summary = parse_zip({{"quilt.mod.json", R"({"quilt_loader": {"id": "qsl", "version": "7.0", "metadata": {"name": "QSL", "contributors": {"carol": "Owner"}}}})"}});
	ASSERT_TRUE(summary);
	EXPECT_EQ(summary->id, "qsl");
	EXPECT_EQ(summary->name, "QSL");
	EXPECT_EQ(summary->version, "7.0");
	EXPECT_EQ(summary->authors, "carol");
}

TEST(ModMetadata, ModsToml) {
	auto const toml = std::string{R"(modLoader="javafml"
authors="dave"

[[mods]]
modId="create"
version="${file.jarVersion}"
displayName="Create" # trailing comment

[[dependencies.create]]
modId="forge"
)"};
	auto const summary = parse_zip({{"META-INF/mods.toml", toml}});
	ASSERT_TRUE(summary);
	EXPECT_EQ(summary->id, "create");
	EXPECT_EQ(summary->name, "Create");
	EXPECT_TRUE(summary->version.empty());
	EXPECT_EQ(summary->authors, "dave");

	auto const neo = parse_zip({{"META-INF/neoforge.mods.toml", "[[mods]]\nmodId = 'neo'\nversion = '1.0'\n"}});
	ASSERT_TRUE(neo);
	EXPECT_EQ(neo->id, "neo");
	EXPECT_EQ(neo->name, "neo");
	EXPECT_EQ(neo->version, "1.0");
}

TEST(ModMetadata, McmodInfo) {
	auto const summary = parse_zip({{"mcmod.info", R"([{"modid": "jei", "name": "Just Enough Items", "version": "4.16", "authorList": ["mezz"]}])"}});
	ASSERT_TRUE(summary);
	EXPECT_EQ(summary->id, "jei");
	EXPECT_EQ(summary->authors, "mezz");
}

TEST(ModMetadata, FabricWinsOverMcmodInfo) {
	auto const summary = parse_zip({
		{"mcmod.info", R"([{"modid": "legacy"}])"},
		{"fabric.mod.json", test::fabric_mod_json("modern", "Modern", "2")},
	});
	ASSERT_TRUE(summary);
	EXPECT_EQ(summary->id, "modern");
}

TEST(ModMetadata, Modpack) {
	auto const index = std::string{R"({
		"name": "Pack", "versionId": "1.2",
		"dependencies": {"minecraft": "1.20.1"},
		"files": [
			{"path": "mods/a.jar", "hashes": {"sha1": "0123456789012345678901234567890123456789"}, "fileSize": 12, "downloads": ["https://cdn.example/a.jar"]},
			{"path": "mods/b.jar", "hashes": {"sha1": "0123456789012345678901234567890123456789"}, "fileSize": 3, "downloads": []}
		]})"};
	auto const summary = parse_zip({{"modrinth.index.json", index}});
	ASSERT_TRUE(summary);
	EXPECT_EQ(summary->name, "Pack");
	EXPECT_EQ(summary->version, "1.2");
	ASSERT_TRUE(summary->modpack);
	EXPECT_EQ(summary->modpack->game_version, "1.20.1");
	ASSERT_EQ(summary->modpack->files.size(), 1u);
	EXPECT_EQ(summary->modpack->files[0].path, "mods/a.jar");
	EXPECT_EQ(summary->modpack->files[0].size, 12u);
}

TEST(ModMetadata, NotAnArchive) {
	auto const bytes = test::to_bytes("definitely not a zip");
	EXPECT_FALSE(ModMetadataManager::parse(bytes, sha1_of(bytes)));
	EXPECT_FALSE(parse_zip({{"readme.txt", "hi"}}));
}

TEST(ModMetadata, CachesByHash) {
	auto manager = ModMetadataManager{};
	auto const bytes = test::make_zip({{"fabric.mod.json", test::fabric_mod_json("a", "A", "1")}});
	auto const first = manager.get_bytes(bytes);
	auto const second = manager.get_bytes(bytes);
	ASSERT_TRUE(first);
	EXPECT_EQ(first.get(), second.get());
	EXPECT_EQ(first->sha1, sha1_of(bytes));
}

TEST(ModMetadata, ContentSourcesPersist) {
	auto const dir = test::TempDir{};
	auto const file = dir / "sources.json";
	auto const hash = sha1_of(test::to_bytes("content"));
	{
		auto manager = ModMetadataManager{file};
		auto const sources = std::vector<std::pair<Sha1Digest, ContentSource>>{{hash, ContentSource::eModrinth}};
		manager.set_content_sources(sources);
		auto const again = std::vector<std::pair<Sha1Digest, ContentSource>>{{hash, ContentSource::eCurseForge}};
		manager.set_content_sources(again);
		EXPECT_EQ(manager.content_source(hash), ContentSource::eModrinth);
	}
	auto const reloaded = ModMetadataManager{file};
	EXPECT_EQ(reloaded.content_source(hash), ContentSource::eModrinth);
	EXPECT_EQ(reloaded.content_source(Sha1Digest{}), ContentSource::eManual);
}

TEST(Mods, EnabledFileNames) {
	EXPECT_EQ(mods::is_enabled_mod_file("mods/a.jar"), true);
	EXPECT_EQ(mods::is_enabled_mod_file("mods/a.jar.disabled"), false);
	EXPECT_FALSE(mods::is_enabled_mod_file("mods/a.zip"));
	EXPECT_FALSE(mods::is_enabled_mod_file("mods/a.disabled"));
}

TEST(Mods, ScanAndMerge) {
	auto const dir = test::TempDir{};
	auto manager = ModMetadataManager{};
	test::write_file(dir / "zeta.jar", test::make_zip({{"fabric.mod.json", test::fabric_mod_json("zeta", "Zeta", "1")}}));
	test::write_file(dir / "alpha.jar.disabled", test::make_zip({{"fabric.mod.json", test::fabric_mod_json("alpha", "Alpha", "1")}}));
	test::write_file(dir / "broken.jar", "not a zip");
	test::write_file(dir / "notes.txt", "ignored");

	auto const scanned = mods::scan(dir.path(), manager);
	ASSERT_EQ(scanned.size(), 2u);
	EXPECT_EQ(scanned[0].mod->id, "alpha");
	EXPECT_FALSE(scanned[0].enabled);
	EXPECT_EQ(scanned[1].mod->id, "zeta");
	EXPECT_TRUE(scanned[1].enabled);
	EXPECT_EQ(scanned[1].filename, "zeta.jar");

	// alpha gets enabled: the old name is gone, the new one appears
	fs::rename(dir / "alpha.jar.disabled", dir / "alpha.jar");
	auto const merged = mods::merge(PathSet{dir / "alpha.jar.disabled", dir / "alpha.jar"}, scanned, manager);
	ASSERT_EQ(merged.size(), 2u);
	EXPECT_EQ(merged[0].filename, "alpha.jar");
	EXPECT_TRUE(merged[0].enabled);
	EXPECT_EQ(merged[1].filename, "zeta.jar");
}
} // namespace lapis
