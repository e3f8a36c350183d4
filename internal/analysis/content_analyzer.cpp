#include "content_analyzer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <string>
#include <utility>

namespace datarouter::analysis {

using model::ContentCategory;

namespace {

constexpr std::string_view kContentType     = "content_type";
constexpr std::string_view kFilename        = "filename";
constexpr std::string_view kSizeBytes       = "size_bytes";
constexpr std::string_view kContentCategory = "content_category";

std::string Lower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

const std::string* Find(const model::Metadata& metadata, std::string_view key) {
  auto it = metadata.find(std::string(key));
  return it == metadata.end() ? nullptr : &it->second;
}

// "text/html; charset=utf-8" -> "text/html"
std::string NormalizeMime(std::string_view raw) {
  auto mime = Lower(raw.substr(0, raw.find(';')));
  mime.erase(0, mime.find_first_not_of(" \t"));
  mime.erase(mime.find_last_not_of(" \t") + 1);
  return mime;
}

std::string ExtensionOf(std::string_view filename) {
  const auto slash = filename.find_last_of("/\\");
  if (slash != std::string_view::npos) filename.remove_prefix(slash + 1);

  const auto dot = filename.rfind('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == filename.size()) return {};
  return Lower(filename.substr(dot + 1));
}

using ExtensionEntry = std::pair<std::string_view, ContentCategory>;

constexpr std::array kExtensions = {
    ExtensionEntry{"jpg", ContentCategory::kImage},      ExtensionEntry{"jpeg", ContentCategory::kImage},
    ExtensionEntry{"png", ContentCategory::kImage},      ExtensionEntry{"gif", ContentCategory::kImage},
    ExtensionEntry{"webp", ContentCategory::kImage},     ExtensionEntry{"svg", ContentCategory::kImage},
    ExtensionEntry{"bmp", ContentCategory::kImage},      ExtensionEntry{"tiff", ContentCategory::kImage},
    ExtensionEntry{"mp4", ContentCategory::kVideo},      ExtensionEntry{"mkv", ContentCategory::kVideo},
    ExtensionEntry{"mov", ContentCategory::kVideo},      ExtensionEntry{"avi", ContentCategory::kVideo},
    ExtensionEntry{"webm", ContentCategory::kVideo},     ExtensionEntry{"mp3", ContentCategory::kAudio},
    ExtensionEntry{"wav", ContentCategory::kAudio},      ExtensionEntry{"flac", ContentCategory::kAudio},
    ExtensionEntry{"ogg", ContentCategory::kAudio},      ExtensionEntry{"aac", ContentCategory::kAudio},
    ExtensionEntry{"txt", ContentCategory::kDocument},   ExtensionEntry{"md", ContentCategory::kDocument},
    ExtensionEntry{"pdf", ContentCategory::kDocument},   ExtensionEntry{"doc", ContentCategory::kDocument},
    ExtensionEntry{"docx", ContentCategory::kDocument},  ExtensionEntry{"html", ContentCategory::kDocument},
    ExtensionEntry{"json", ContentCategory::kDocument},  ExtensionEntry{"xml", ContentCategory::kDocument},
    ExtensionEntry{"csv", ContentCategory::kDataset},    ExtensionEntry{"parquet", ContentCategory::kDataset},
    ExtensionEntry{"avro", ContentCategory::kDataset},   ExtensionEntry{"arrow", ContentCategory::kDataset},
    ExtensionEntry{"npy", ContentCategory::kDataset},    ExtensionEntry{"npz", ContentCategory::kDataset},
    ExtensionEntry{"tfrecord", ContentCategory::kDataset}, ExtensionEntry{"pt", ContentCategory::kModel},
    ExtensionEntry{"pth", ContentCategory::kModel},      ExtensionEntry{"onnx", ContentCategory::kModel},
    ExtensionEntry{"h5", ContentCategory::kModel},       ExtensionEntry{"pkl", ContentCategory::kModel},
    ExtensionEntry{"safetensors", ContentCategory::kModel}, ExtensionEntry{"tflite", ContentCategory::kModel},
    ExtensionEntry{"zip", ContentCategory::kArchive},    ExtensionEntry{"tar", ContentCategory::kArchive},
    ExtensionEntry{"gz", ContentCategory::kArchive},     ExtensionEntry{"tgz", ContentCategory::kArchive},
    ExtensionEntry{"bz2", ContentCategory::kArchive},    ExtensionEntry{"xz", ContentCategory::kArchive},
    ExtensionEntry{"7z", ContentCategory::kArchive},     ExtensionEntry{"zst", ContentCategory::kArchive},
};

constexpr std::array<std::string_view, 6> kDocumentMimes = {
    "application/pdf",
    "application/msword",
    "application/rtf",
    "application/xml",
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
    "application/vnd.oasis.opendocument.text",
};

constexpr std::array<std::string_view, 7> kArchiveMimes = {
    "application/zip",     "application/x-tar",   "application/gzip", "application/x-gzip",
    "application/x-bzip2", "application/x-7z-compressed", "application/zstd",
};

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

bool Contains(const auto& table, std::string_view value) {
  return std::find(table.begin(), table.end(), value) != table.end();
}

} // namespace

ContentCategory ContentAnalyzer::CategoryFromMime(std::string_view raw) {
  const auto mime = NormalizeMime(raw);

  if (StartsWith(mime, "image/")) return ContentCategory::kImage;
  if (StartsWith(mime, "video/")) return ContentCategory::kVideo;
  if (StartsWith(mime, "audio/")) return ContentCategory::kAudio;
  if (StartsWith(mime, "text/") || mime == "application/json") return ContentCategory::kDocument;
  if (Contains(kDocumentMimes, mime)) return ContentCategory::kDocument;
  if (Contains(kArchiveMimes, mime)) return ContentCategory::kArchive;
  if (mime == "application/vnd.apache.parquet" || mime == "application/x-parquet") return ContentCategory::kDataset;
  if (mime == "application/onnx") return ContentCategory::kModel;

  return ContentCategory::kBinary;
}

ContentCategory ContentAnalyzer::CategoryFromExtension(std::string_view extension) {
  const auto ext = Lower(extension);
  for (const auto& [name, category] : kExtensions) {
    if (name == ext) return category;
  }
  return ContentCategory::kBinary;
}

model::ContentDescriptor ContentAnalyzer::Analyze(std::string_view content, const model::Metadata& metadata) {
  model::ContentDescriptor descriptor;
  descriptor.metadata   = metadata;
  descriptor.size_bytes = content.size();

  if (const auto* size = Find(metadata, kSizeBytes)) {
    std::uint64_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(size->data(), size->data() + size->size(), parsed);
    if (ec == std::errc() && ptr == size->data() + size->size()) {
      descriptor.size_bytes = parsed;
    }
  }

  if (const auto* filename = Find(metadata, kFilename); filename && !filename->empty()) {
    descriptor.filename  = *filename;
    descriptor.extension = ExtensionOf(*filename);
  }

  if (const auto* mime = Find(metadata, kContentType)) {
    descriptor.mime_type = NormalizeMime(*mime);
  }

  if (const auto* explicit_category = Find(metadata, kContentCategory)) {
    if (auto category = model::ParseContentCategory(Lower(*explicit_category))) {
      descriptor.category = *category;
      return descriptor;
    }
  }

  if (!descriptor.mime_type.empty()) {
    descriptor.category = CategoryFromMime(descriptor.mime_type);
    if (descriptor.category != ContentCategory::kBinary) {
      return descriptor;
    }
  }

  if (!descriptor.extension.empty()) {
    descriptor.category = CategoryFromExtension(descriptor.extension);
  }
  return descriptor;
}

} // namespace datarouter::analysis
