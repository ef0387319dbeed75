#include <arrow/io/file.h>
#include <arrow/io/stdio.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitNotFound = 2;
constexpr int kExitFailure  = 3;

constexpr int64_t kDefaultTtlSeconds = 24 * 60 * 60;

void Usage() {
  std::cerr << "Usage:\n"
            << "  blobkeepctl --config <config.yaml> put <path|-> [--ttl <seconds>] [--content-type <type>] [--filename <name>]\n"
            << "  blobkeepctl --config <config.yaml> get <id>\n"
            << "  blobkeepctl --config <config.yaml> cat <id>\n"
            << "  blobkeepctl --config <config.yaml> delete <id>\n"
            << "  blobkeepctl --config <config.yaml> sweep\n";
}

struct PutArgs {
  std::string path;
  int64_t     ttl_seconds = kDefaultTtlSeconds;
  std::string content_type;
  std::string filename;
};

std::optional<PutArgs> ParsePutArgs(const std::vector<std::string>& args) {
  if (args.empty()) return std::nullopt;

  PutArgs out;
  out.path = args[0];
  if (out.path != "-") out.filename = std::filesystem::path(out.path).filename().string();

  for (size_t i = 1; i < args.size(); ++i) {
    if (i + 1 >= args.size()) return std::nullopt;
    const auto& flag  = args[i];
    const auto& value = args[++i];

    if (flag == "--ttl") {
      char* end       = nullptr;
      out.ttl_seconds = std::strtoll(value.c_str(), &end, 10);
      if (value.empty() || *end != '\0') return std::nullopt;
      if (out.ttl_seconds > blobkeep::util::kMaxTtl.count() || out.ttl_seconds < -blobkeep::util::kMaxTtl.count()) {
        std::cerr << "--ttl must be within +/-" << blobkeep::util::kMaxTtl.count() << " seconds\n";
        return std::nullopt;
      }
    } else if (flag == "--content-type") {
      out.content_type = value;
    } else if (flag == "--filename") {
      out.filename = value;
    } else {
      return std::nullopt;
    }
  }
  return out;
}

std::shared_ptr<arrow::io::InputStream> OpenInput(const std::string& path) {
  if (path == "-") return std::make_shared<arrow::io::StdinStream>();

  auto file = arrow::io::ReadableFile::Open(path);
  if (!file.ok()) throw blobkeep::util::IOError("cannot open " + path + ": " + file.status().ToString());
  return *file;
}

void PrintItem(const blobkeep::model::Item& item) {
  std::cout << "id:           " << item.id << "\n"
            << "filename:     " << item.filename << "\n"
            << "content_type: " << item.content_type << "\n"
            << "created:      " << blobkeep::util::FormatUtc(item.created) << "\n"
            << "expires:      " << blobkeep::util::FormatUtc(item.expires) << "\n";
  if (!item.attributes.empty()) std::cout << "attributes:   " << item.attributes << "\n";
}

void CopyToStdout(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  arrow::io::StdoutStream out;
  while (true) {
    auto chunk = file->Read(1 << 16);
    if (!chunk.ok()) throw blobkeep::util::IOError(chunk.status().ToString());
    if ((*chunk)->size() == 0) break;

    auto status = out.Write(*chunk);
    if (!status.ok()) throw blobkeep::util::IOError(status.ToString());
  }

  auto status = file->Close();
  if (!status.ok()) throw blobkeep::util::IOError(status.ToString());
  std::cout.flush();
}

int Run(blobkeep::core::Store& store, const std::string& command, const std::vector<std::string>& args) {
  if (command == "put") {
    auto put = ParsePutArgs(args);
    if (!put) {
      Usage();
      return kExitUsage;
    }

    blobkeep::model::Item item;
    item.filename     = put->filename;
    item.content_type = put->content_type;
    item.created      = blobkeep::util::Now();
    item.expires      = blobkeep::util::ExpiryAfter(item.created, put->ttl_seconds);

    std::cout << store.Put(item, OpenInput(put->path)) << "\n";
    return kExitOk;
  }

  if (command == "sweep") {
    std::cout << store.SweepExpired() << "\n";
    return kExitOk;
  }

  if (args.size() != 1) {
    Usage();
    return kExitUsage;
  }
  const auto& id = args[0];

  if (command == "get") {
    PrintItem(store.Get(id));
    return kExitOk;
  }
  if (command == "cat") {
    // Get first so an expired item is never served
    (void)store.Get(id);
    CopyToStdout(store.GetFile(id));
    return kExitOk;
  }
  if (command == "delete") {
    store.Delete(id);
    return kExitOk;
  }

  Usage();
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return kExitUsage;
  }

  const std::string              config_path = argv[2];
  const std::string              command     = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  int code = kExitOk;
  try {
    auto config = blobkeep::config::ConfigLoader::LoadFromYaml(config_path);
    blobkeep::observability::InitializeLogging(config);

    auto store = blobkeep::factory::BuildStore(config);

    code = Run(*store, command, args);
    store->Close();
  } catch (const blobkeep::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << std::endl;
    code = kExitNotFound;
  } catch (const std::exception& e) {
    BLOBKEEP_LOG_ERROR("Fatal error", {blobkeep::observability::StringField("error", e.what())});
    code = kExitFailure;
  }

  blobkeep::observability::ShutdownLogging();
  return code;
}
