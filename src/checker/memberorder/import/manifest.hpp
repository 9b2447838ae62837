#ifndef MEMBERORDER_IMPORT_MANIFEST_HPP
#define MEMBERORDER_IMPORT_MANIFEST_HPP 1

#ifndef MEMBERORDER_MODEL_SOURCEFILE_HPP
  #include "memberorder/model/sourcefile.hpp"
#endif

#include <memory>

namespace memberorder::import {
  using memberorder::model::SourceFile;

  /** Build a source file from the text of a member manifest. The manifest's 'source'
      path is resolved relative to 'baseDir'. 'manifestPath' is only used for error
      messages. Returns null after reporting an error. */
  std::unique_ptr<SourceFile> parseManifest(
      StringRef text, StringRef manifestPath, StringRef baseDir);

  /** Read a member manifest from disk. Returns null after reporting an error. */
  std::unique_ptr<SourceFile> loadManifest(StringRef manifestPath);
}

#endif
