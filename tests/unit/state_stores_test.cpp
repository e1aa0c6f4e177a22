#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "compact_fixtures.hpp"
#include "strata/storage/file_list.hpp"
#include "strata/storage/kv_manifest.hpp"
#include "strata/storage/pending_delete_store.hpp"

namespace fs = std::filesystem;
using namespace strata::storage;
using strata::core::error_code;

// Test IDs for audit traceability:
//   TID-STATE-001: escaped values survive a save/load cycle
//   TID-STATE-002: pending deletes and removing markers persist across reopen
//   TID-STATE-003: file list records, deletes and persists metadata

TEST_CASE("kv manifest escapes separators and control bytes", "[storage][manifest]") {
  REQUIRE(escape_value("a b=c%d") == "a%20b%3Dc%25d");
  REQUIRE(unescape_value("a%20b%3Dc%25d").value() == "a b=c%d");
  REQUIRE_FALSE(unescape_value("bad%2").has_value());
  REQUIRE_FALSE(unescape_value("bad%zz").has_value());
}

TEST_CASE("kv manifest round trip and header check", "[storage][manifest]") {
  compact_fixtures::TempDir dir("kv_manifest");
  auto path = dir.path() / "state.manifest";

  auto empty = load_kv_manifest(path, "test v1");
  REQUIRE(empty.has_value());
  REQUIRE(empty->empty());

  std::vector<KvLine> lines{KvLine{{"key", "files/a b/c.seg"}, {"org", "default"}}, KvLine{{"key", "x"}}};
  REQUIRE(save_kv_manifest(path, "test v1", lines).has_value());
  REQUIRE_FALSE(fs::exists(path.string() + ".tmp"));
  auto loaded = load_kv_manifest(path, "test v1");
  REQUIRE(loaded.has_value());
  REQUIRE(*loaded == lines);

  auto wrong = load_kv_manifest(path, "other v1");
  REQUIRE_FALSE(wrong.has_value());
  REQUIRE(wrong.error().code == error_code::data_integrity);
}

TEST_CASE("pending deletes persist across reopen", "[storage][pending]") {
  compact_fixtures::TempDir dir("pending_store");
  {
    auto store = FilePendingDeleteStore::open(dir.path());
    REQUIRE(store.has_value());
    REQUIRE((*store)->add("default", "", "files/default/logs/app/1/2024/01/15/10/a.seg").has_value());
    REQUIRE((*store)->add("default", "", "files/default/logs/app/1/2024/01/15/10/b.seg").has_value());
    // duplicate add is a no-op
    REQUIRE((*store)->add("default", "", "files/default/logs/app/1/2024/01/15/10/b.seg").has_value());
    REQUIRE((*store)->size() == 2);
    REQUIRE((*store)->remove("files/default/logs/app/1/2024/01/15/10/a.seg").has_value());
    REQUIRE((*store)->remove("never-added").has_value());
  }
  auto reopened = FilePendingDeleteStore::open(dir.path());
  REQUIRE(reopened.has_value());
  auto entries = (*reopened)->list();
  REQUIRE(entries.has_value());
  REQUIRE(entries->size() == 1);
  REQUIRE(entries->front().org == "default");
  REQUIRE(entries->front().key == "files/default/logs/app/1/2024/01/15/10/b.seg");
}

TEST_CASE("corrupt pending delete manifest is reported", "[storage][pending]") {
  compact_fixtures::TempDir dir("pending_corrupt");
  {
    std::ofstream out(dir.path() / "pending_delete.manifest");
    out << "strata-pending-delete v1\norg=default account=\n";
  }
  auto store = FilePendingDeleteStore::open(dir.path());
  REQUIRE_FALSE(store.has_value());
  REQUIRE(store.error().code == error_code::data_integrity);
}

TEST_CASE("removing markers persist across reopen", "[storage][removing]") {
  compact_fixtures::TempDir dir("removing_store");
  {
    auto store = FileRemovingMarkerStore::open(dir.path());
    REQUIRE(store.has_value());
    REQUIRE((*store)->add("k1").has_value());
    REQUIRE((*store)->add("k2").has_value());
    REQUIRE((*store)->remove("k1").has_value());
  }
  auto reopened = FileRemovingMarkerStore::open(dir.path());
  REQUIRE(reopened.has_value());
  auto keys = (*reopened)->list();
  REQUIRE(keys.has_value());
  REQUIRE(*keys == std::vector<std::string>{"k2"});
}

TEST_CASE("file list records, lists and deletes", "[storage][file_list]") {
  compact_fixtures::TempDir dir("file_list");
  auto meta = compact_fixtures::sized_meta(1000, 10, 5);
  meta.compressed_size = 400;
  {
    auto fl = LocalFileList::open(dir.path());
    REQUIRE(fl.has_value());
    REQUIRE((*fl)->record("", "files/default/logs/app/2024/01/15/10/a.seg", meta, false).has_value());
    REQUIRE((*fl)->record("acct", "files/default/logs/web/2024/01/15/10/b.seg", meta, false).has_value());
    REQUIRE((*fl)->exists("", "files/default/logs/app/2024/01/15/10/a.seg").value());
    REQUIRE_FALSE((*fl)->exists("acct", "files/default/logs/app/2024/01/15/10/a.seg").value());
    REQUIRE_FALSE((*fl)->record("", "", meta, false).has_value());
  }
  auto fl = LocalFileList::open(dir.path());
  REQUIRE(fl.has_value());
  auto got = (*fl)->get("", "files/default/logs/app/2024/01/15/10/a.seg");
  REQUIRE(got.has_value());
  REQUIRE(*got == meta);
  auto app = (*fl)->list("files/default/logs/app/");
  REQUIRE(app.has_value());
  REQUIRE(app->size() == 1);

  REQUIRE((*fl)->record("", "files/default/logs/app/2024/01/15/10/a.seg", meta, true).has_value());
  REQUIRE_FALSE((*fl)->exists("", "files/default/logs/app/2024/01/15/10/a.seg").value());
}
