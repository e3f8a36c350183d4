#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/storage/disk/disk_arrow_store.hpp"
#include "internal/storage/ram/ram_arrow_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using datarouter::model::ContentFilter;
using datarouter::storage::BackendStore;
using datarouter::storage::DiskArrowStore;
using datarouter::storage::RamArrowStore;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "datarouter_arrow_store_tests" / name;
  std::filesystem::remove_all(dir);
  return dir;
}

// Behaviour every backend store shares.
void ExerciseStore(BackendStore& store) {
  const std::string binary("a\0b\xff", 4);

  auto generated = store.Add(binary, {{"content_type", "application/octet-stream"}});
  assert(!generated.empty());
  assert(store.Get(generated) == binary);

  auto named = store.Add("<svg/>", {{"content_id", "logo"}, {"content_type", "image/svg+xml"}, {"team", "web"}});
  assert(named == "logo");
  assert(store.Get("logo") == "<svg/>");
  assert(store.GetMetadata("logo").at("team") == "web");

  store.Add("plain", {{"content_id", "notes"}});

  // overwrite under the same id
  store.Add("<svg></svg>", {{"content_id", "logo"}, {"content_type", "image/svg+xml"}, {"team", "web"}});
  assert(store.Get("logo") == "<svg></svg>");

  assert(store.List({}).size() == 3);

  ContentFilter images;
  images.type = "image/";
  auto listed = store.List(images);
  assert(listed.size() == 1);
  assert(listed[0].content_id == "logo");
  assert(listed[0].size_bytes == 11);
  assert(listed[0].metadata.at("team") == "web");

  const auto described = store.Describe("logo");
  assert(described.size_bytes == 11);
  assert(described.content_type == "image/svg+xml");
  assert(described.metadata.at("team") == "web");

  ContentFilter by_prefix;
  by_prefix.prefix = "no";
  assert(store.List(by_prefix).size() == 1);

  ContentFilter large;
  large.min_size_bytes = 6;
  assert(store.List(large).size() == 1);

  // items without a content_type are listed as octet-stream
  ContentFilter untyped;
  untyped.prefix = "notes";
  assert(store.List(untyped)[0].content_type == "application/octet-stream");

  assert(store.Delete("logo"));
  assert(!store.Delete("logo"));
  assert(Throws<datarouter::util::NotFound>([&] { store.Get("logo"); }));
  assert(Throws<datarouter::util::NotFound>([&] { store.GetMetadata("logo"); }));
  assert(Throws<datarouter::util::NotFound>([&] { store.Describe("logo"); }));
  assert(store.List({}).size() == 2);
}

void TestRamStore() {
  RamArrowStore store("hot");
  assert(store.Name() == "hot");
  ExerciseStore(store);
}

void TestDiskStore() {
  const auto root = FreshDir("disk");
  {
    DiskArrowStore store("archive", root, false);
    ExerciseStore(store);

    assert(Throws<datarouter::util::ValidationError>([&] { store.Add("x", {{"content_id", "../escape"}}); }));
    assert(Throws<datarouter::util::ValidationError>([&] { store.Get(".."); }));
    assert(!std::filesystem::exists(root.parent_path() / "escape.bin"));
  }

  // contents survive reopening
  DiskArrowStore reopened("archive", root, true);
  assert(reopened.Get("notes") == "plain");
  assert(reopened.List({}).size() == 2);

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestRamStore();
  TestDiskStore();

  std::cout << "datarouter_unit_arrow_stores: pass\n";
  return 0;
}
