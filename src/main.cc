/*
 * main.cc
 * -------------------------------------------------------------------------
 * Command-line entry point for s3bulk.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2012, Tarick Bedeir.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <getopt.h>
#include <stdlib.h>

#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/lexical_cast.hpp>

#include "base/config.h"
#include "base/errors.h"
#include "base/logger.h"
#include "base/statistics.h"
#include "base/xml.h"
#include "services/service.h"
#include "transfer/arguments.h"
#include "transfer/batch_result.h"
#include "transfer/downloader.h"
#include "transfer/uploader.h"

namespace s3bulk {
namespace {
constexpr int EXIT_TRANSFER_FAILED = 1;
constexpr int EXIT_USAGE = 2;

constexpr char SHORT_OPTIONS[] = ":c:r:e:j:vhV";

constexpr option LONG_OPTIONS[] = {
    {"config", required_argument, nullptr, 'c'},
    {"region", required_argument, nullptr, 'r'},
    {"endpoint", required_argument, nullptr, 'e'},
    {"max-concurrent", required_argument, nullptr, 'j'},
    {"verbose", no_argument, nullptr, 'v'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {nullptr, 0, nullptr, '\0'}};

struct Options {
  std::string config_file;
  std::string region;
  std::string endpoint;
  int max_concurrent = 0;
  int verbosity = 0;
};

[[noreturn]] void PrintUsage(const char *arg0, int status) {
  const char *base_name = std::strrchr(arg0, '/');
  base_name = base_name ? base_name + 1 : arg0;
  std::cerr
      << "Usage: " << base_name
      << " [options] <command> <bucket> [...]\n"
         "\n"
         "Where <command> is one of:\n"
         "\n"
         "  get <bucket> <key> <path>            Download one object to "
         "<path>.\n"
         "  get-many <bucket> <dir> <key>...     Download objects into <dir>, "
         "named after\n"
         "                                       the last segment of each "
         "key.\n"
         "  get-paths <bucket> <key>=<path>...   Download each object to its "
         "own path.\n"
         "  put <bucket> <key> <path>            Upload one file as <key>.\n"
         "  put-many <bucket> <path>=<key>...    Upload each file as its "
         "key.\n"
         "\n"
         "[options] can be:\n"
         "\n"
         "  -c, --config <path>          Use configuration at <path> rather "
         "than the default.\n"
         "  -r, --region <region>        Override aws_region.\n"
         "  -e, --endpoint <host>        Override aws_service_endpoint.\n"
         "  -j, --max-concurrent <n>     Run at most <n> transfers at once.\n"
         "  -v, --verbose                Log more (repeat for more detail).\n"
         "  -h, --help                   Print this message.\n"
         "  -V, --version                Print version and exit.\n"
         "\n"
         "Exit status is 0 if every transfer succeeded, 1 if any failed, and "
         "2 on\n"
         "usage or setup errors."
      << std::endl;
  exit(status);
}

[[noreturn]] void PrintVersion() {
  std::cout << PACKAGE_NAME << ", " << PACKAGE_VERSION_WITH_REV
            << ", services: " << services::Service::GetEnabledServices()
            << std::endl;
  exit(0);
}

int LogLevelForVerbosity(int verbosity) {
  if (verbosity <= 0) return LOG_WARNING;
  if (verbosity == 1) return LOG_INFO;
  return LOG_DEBUG;
}

void Init(const Options &options) {
  base::Logger::Init(base::Logger::Mode::STDERR,
                     LogLevelForVerbosity(options.verbosity));

  if (options.config_file.empty())
    base::Config::InitFromDefaults();
  else
    base::Config::Init(options.config_file);

  if (!options.region.empty()) base::Config::set_aws_region(options.region);
  if (!options.endpoint.empty())
    base::Config::set_aws_service_endpoint(options.endpoint);
  if (options.max_concurrent)
    base::Config::set_max_concurrent_transfers(options.max_concurrent);
  if (options.verbosity > 2) base::Config::set_verbose_requests(true);

  base::XmlDocument::Init();

  if (!base::Config::stats_file().empty())
    base::Statistics::Init(base::Config::stats_file());
}

void Terminate() {
  base::Statistics::Collect();
  base::Statistics::Terminate();
}

size_t GetMaxConcurrent() {
  const int max_concurrent = base::Config::max_concurrent_transfers();
  if (max_concurrent < 1)
    throw std::invalid_argument("max_concurrent_transfers must be at least 1.");
  return static_cast<size_t>(max_concurrent);
}

int ReportBatch(const transfer::BatchResult &result) {
  for (const auto &path : result.successful()) std::cout << path << "\n";
  for (const auto &f : result.failed())
    std::cout << "FAILED " << f.key << ": " << f.message << "\n";
  std::cout << result.ToString() << std::endl;

  return result.is_complete_success() ? 0 : EXIT_TRANSFER_FAILED;
}

int RunCommand(const std::string &command,
               const std::vector<std::string> &args, const char *arg0) {
  if (args.empty()) PrintUsage(arg0, EXIT_USAGE);

  const std::string &bucket = args[0];

  if (command == "get" || command == "put") {
    if (args.size() != 3) PrintUsage(arg0, EXIT_USAGE);

    auto store = services::Service::Create();

    if (command == "get")
      std::cout << transfer::Downloader(store, 1).DownloadOne(bucket, args[1],
                                                              args[2])
                << std::endl;
    else
      std::cout << transfer::Uploader(store, 1).UploadOne(bucket, args[1],
                                                          args[2])
                << std::endl;

    return 0;
  }

  if (command == "get-many") {
    if (args.size() < 2) PrintUsage(arg0, EXIT_USAGE);

    transfer::Downloader downloader(services::Service::Create(),
                                    GetMaxConcurrent());
    return ReportBatch(downloader.DownloadMany(
        bucket, std::vector<std::string>(args.begin() + 2, args.end()),
        args[1]));
  }

  if (command == "get-paths") {
    const auto downloads = transfer::Arguments::ParseDownloads(
        std::vector<std::string>(args.begin() + 1, args.end()));

    transfer::Downloader downloader(services::Service::Create(),
                                    GetMaxConcurrent());
    return ReportBatch(downloader.DownloadManyWithPaths(bucket, downloads));
  }

  if (command == "put-many") {
    const auto uploads = transfer::Arguments::ParseUploads(
        std::vector<std::string>(args.begin() + 1, args.end()));

    transfer::Uploader uploader(services::Service::Create(),
                                GetMaxConcurrent());
    return ReportBatch(uploader.UploadMany(bucket, uploads));
  }

  PrintUsage(arg0, EXIT_USAGE);
}
}  // namespace
}  // namespace s3bulk

int main(int argc, char **argv) {
  int opt = 0;
  s3bulk::Options options;

  while ((opt = getopt_long(argc, argv, s3bulk::SHORT_OPTIONS,
                            s3bulk::LONG_OPTIONS, nullptr)) != -1) {
    switch (opt) {
      case 'c':
        options.config_file = optarg;
        break;

      case 'r':
        options.region = optarg;
        break;

      case 'e':
        options.endpoint = optarg;
        break;

      case 'j':
        try {
          options.max_concurrent = boost::lexical_cast<int>(optarg);
        } catch (const boost::bad_lexical_cast &) {
          options.max_concurrent = -1;
        }
        if (options.max_concurrent < 1) {
          std::cerr << "invalid value for --max-concurrent: " << optarg
                    << std::endl;
          return s3bulk::EXIT_USAGE;
        }
        break;

      case 'v':
        ++options.verbosity;
        break;

      case 'h':
        s3bulk::PrintUsage(argv[0], 0);

      case 'V':
        s3bulk::PrintVersion();

      default:
        s3bulk::PrintUsage(argv[0], s3bulk::EXIT_USAGE);
    }
  }

  if (optind >= argc) s3bulk::PrintUsage(argv[0], s3bulk::EXIT_USAGE);

  const std::string command = argv[optind++];
  const std::vector<std::string> args(argv + optind, argv + argc);

  int ret = 0;
  try {
    s3bulk::Init(options);
    ret = s3bulk::RunCommand(command, args, argv[0]);

  } catch (const s3bulk::base::BatchSetupError &e) {
    S3BULK_LOG(LOG_ERR, "main", "batch not started: %s\n", e.what());
    ret = s3bulk::EXIT_USAGE;

  } catch (const s3bulk::base::TransferError &e) {
    S3BULK_LOG(LOG_ERR, "main", "%s\n", e.what());
    ret = s3bulk::EXIT_TRANSFER_FAILED;

  } catch (const std::exception &e) {
    S3BULK_LOG(LOG_ERR, "main", "caught exception: %s\n", e.what());
    ret = s3bulk::EXIT_USAGE;
  }

  s3bulk::Terminate();
  return ret;
}
