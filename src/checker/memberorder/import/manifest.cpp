#include "memberorder/error/diagnostics.hpp"
#include "memberorder/import/manifest.hpp"
#include "memberorder/model/annotation.hpp"
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/JSON.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <limits>

namespace memberorder::import {
  using namespace llvm;
  using namespace llvm::sys;
  using memberorder::error::diag;
  using memberorder::model::AnnotationRule;
  using memberorder::model::MemberDescriptor;
  using memberorder::model::TypeDecl;
  using memberorder::source::FileSource;
  using memberorder::source::Location;
  using memberorder::source::ProgramSource;

  namespace {
    struct ManifestLocation {
      int line = 0;
      int column = 0;
      Optional<int> endLine;
      Optional<int> endColumn;
    };

    struct ManifestMember {
      MemberDescriptor::Kind kind = MemberDescriptor::Kind::FIELD;
      Optional<std::string> name;
      Optional<std::vector<std::string>> names;
      Optional<bool> isPrivate;
      std::vector<std::string> annotations;
      Optional<ManifestLocation> location;
    };

    struct ManifestType {
      std::string name;
      Optional<ManifestLocation> location;
      std::vector<ManifestMember> members;
    };

    struct Manifest {
      std::string source;
      std::vector<ManifestType> types;
    };

    // Columns are stored in 16 bits.
    bool isValidColumn(int column) {
      return column >= 0 && column <= std::numeric_limits<int16_t>::max();
    }

    bool fromJSON(const json::Value& value, ManifestLocation& loc, json::Path path) {
      json::ObjectMapper mapper(value, path);
      if (!mapper
          || !mapper.map("line", loc.line)
          || !mapper.mapOptional("column", loc.column)
          || !mapper.map("endLine", loc.endLine)
          || !mapper.map("endColumn", loc.endColumn)) {
        return false;
      }
      if (!isValidColumn(loc.column)) {
        path.field("column").report("column out of range");
        return false;
      }
      if (loc.endColumn && !isValidColumn(*loc.endColumn)) {
        path.field("endColumn").report("column out of range");
        return false;
      }
      return true;
    }

    bool fromJSON(const json::Value& value, ManifestMember& member, json::Path path) {
      json::ObjectMapper mapper(value, path);
      std::string kind;
      if (!mapper || !mapper.map("kind", kind)) {
        return false;
      }
      if (!model::parseKind(kind, member.kind)) {
        path.field("kind").report("unknown member kind");
        return false;
      }
      return mapper.map("name", member.name)
          && mapper.map("names", member.names)
          && mapper.map("private", member.isPrivate)
          && mapper.mapOptional("annotations", member.annotations)
          && mapper.map("location", member.location);
    }

    bool fromJSON(const json::Value& value, ManifestType& type, json::Path path) {
      json::ObjectMapper mapper(value, path);
      return mapper
          && mapper.mapOptional("name", type.name)
          && mapper.map("location", type.location)
          && mapper.map("members", type.members);
    }

    bool fromJSON(const json::Value& value, Manifest& manifest, json::Path path) {
      json::ObjectMapper mapper(value, path);
      return mapper
          && mapper.map("source", manifest.source)
          && mapper.map("types", manifest.types);
    }

    Location makeLocation(ProgramSource* source, const Optional<ManifestLocation>& loc) {
      if (!loc) {
        return Location(source, 0, 0, 0, 0);
      }
      return Location(
          source,
          loc->line,
          loc->column,
          loc->endLine.getValueOr(loc->line),
          loc->endColumn.getValueOr(loc->column));
    }

    bool hasRecognizedAnnotation(const ManifestMember& member) {
      for (auto& name : member.annotations) {
        if (AnnotationRule::parse(name)) {
          return true;
        }
      }
      return false;
    }

    void addMember(
        TypeDecl& td, const ManifestMember& mm, const Location& loc, StringRef name) {
      td.members().emplace_back(mm.kind, loc, name);
      auto& member = td.members().back();
      if (mm.isPrivate) {
        member.setPrivate(*mm.isPrivate);
      }
      member.annotations() = mm.annotations;
    }

    void addMembers(TypeDecl& td, const ManifestMember& mm, ProgramSource* source) {
      auto loc = makeLocation(source, mm.location);
      if (mm.names && !mm.names->empty()) {
        // An annotated field declaration is a single member named after its first
        // variable; otherwise each variable is a member of its own.
        if (mm.kind != MemberDescriptor::Kind::FIELD || hasRecognizedAnnotation(mm)) {
          addMember(td, mm, loc, mm.names->front());
        } else {
          for (auto& name : *mm.names) {
            addMember(td, mm, loc, name);
          }
        }
      } else {
        addMember(td, mm, loc, mm.name.getValueOr(""));
      }
    }
  }

  std::unique_ptr<SourceFile> parseManifest(
      StringRef text, StringRef manifestPath, StringRef baseDir) {
    auto document = json::parse(text);
    if (!document) {
      diag.error() << manifestPath << ": " << toString(document.takeError());
      return nullptr;
    }

    Manifest manifest;
    json::Path::Root root(manifestPath);
    if (!fromJSON(*document, manifest, root)) {
      diag.error() << manifestPath << ": " << toString(root.getError());
      return nullptr;
    }

    SmallString<128> fullPath;
    if (path::is_absolute(manifest.source) || baseDir.empty()) {
      fullPath = manifest.source;
    } else {
      path::append(fullPath, baseDir, manifest.source);
    }
    path::remove_dots(fullPath);

    auto file = std::make_unique<SourceFile>(
        std::make_unique<FileSource>(fullPath, manifest.source));
    for (auto& mt : manifest.types) {
      file->types().emplace_back(makeLocation(file->source(), mt.location), mt.name);
      auto& td = file->types().back();
      for (auto& mm : mt.members) {
        addMembers(td, mm, file->source());
      }
    }
    return file;
  }

  std::unique_ptr<SourceFile> loadManifest(StringRef manifestPath) {
    auto buffer = MemoryBuffer::getFile(manifestPath);
    if (!buffer) {
      diag.error() << "Cannot read manifest '" << manifestPath << "': "
          << buffer.getError().message();
      return nullptr;
    }
    return parseManifest((*buffer)->getBuffer(), manifestPath, path::parent_path(manifestPath));
  }
}
