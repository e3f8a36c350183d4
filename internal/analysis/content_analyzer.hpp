#pragma once

#include <string_view>

#include "internal/model/content.hpp"

namespace datarouter::analysis {

/*
  Classifies content + caller metadata into a ContentDescriptor.

  Order of precedence for the category:
    1. explicit "content_category" metadata key (if it names a category)
    2. MIME type ("content_type")
    3. filename extension
    4. binary

  Never fails: unknown input maps to ContentCategory::kBinary.
*/
class ContentAnalyzer {
 public:
  static model::ContentDescriptor Analyze(std::string_view content, const model::Metadata& metadata);

  static model::ContentCategory CategoryFromMime(std::string_view mime_type);
  static model::ContentCategory CategoryFromExtension(std::string_view extension);
};

} // namespace datarouter::analysis
