/*
    Emporium - economy and progression engine for games
    Copyright (C) 2020  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "config.h"

#include "catalog.hpp"
#include "clock.hpp"
#include "database.hpp"
#include "engine.hpp"
#include "eventsink.hpp"
#include "expiryjob.hpp"
#include "rpcserver.hpp"
#include "schema.hpp"
#include "proto/config.pb.h"

#include <jsonrpccpp/server/connectors/httpserver.h>

#include <google/protobuf/text_format.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace
{

DEFINE_string (db_path, "",
               "path of the SQLite database file to use");
DEFINE_string (config, "",
               "path of the configuration file (protobuf text format)");

DEFINE_int32 (rpc_port, 0,
              "the port at which Emporium's JSON-RPC server will be started");

DEFINE_int32 (busy_timeout_ms, 5'000,
              "timeout (in milliseconds) for waiting on database locks");
DEFINE_int32 (expiry_sweep_seconds, 60,
              "interval (in seconds) for marking expired trade offers;"
              " zero disables the sweep");

/**
 * Exception thrown for usage errors (won't be logged).
 */
class UsageError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * Reads the configuration from the text-format file.
 */
emporium::proto::Config
LoadConfig (const std::string& path)
{
  std::ifstream in(path);
  if (!in)
    throw UsageError ("cannot read config file " + path);

  std::ostringstream content;
  content << in.rdbuf ();

  emporium::proto::Config res;
  if (!google::protobuf::TextFormat::ParseFromString (content.str (), &res))
    throw UsageError ("invalid config file " + path);

  return res;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Run the Emporium economy and progression engine");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  try
    {
      if (FLAGS_db_path.empty ())
        throw UsageError ("--db_path must be set");
      if (FLAGS_config.empty ())
        throw UsageError ("--config must be set");
      if (FLAGS_rpc_port == 0)
        throw UsageError ("--rpc_port must be set");
      if (FLAGS_busy_timeout_ms < 0 || FLAGS_expiry_sweep_seconds < 0)
        throw UsageError ("timeouts and intervals must not be negative");

      const auto config = LoadConfig (FLAGS_config);

      emporium::Database db(FLAGS_db_path,
                            std::chrono::milliseconds (FLAGS_busy_timeout_ms));
      emporium::SetupSchema (db);
      emporium::LoadCatalog (db, config);

      emporium::Clock clock;
      emporium::LoggingEventSink events;
      emporium::Engine engine(db, config, events, clock);

      std::unique_ptr<emporium::ExpiryJob> expiry;
      if (FLAGS_expiry_sweep_seconds > 0)
        expiry = std::make_unique<emporium::ExpiryJob> (
            engine, std::chrono::seconds (FLAGS_expiry_sweep_seconds));

      jsonrpc::HttpServer httpServer(FLAGS_rpc_port);
      httpServer.BindLocalhost ();
      emporium::RpcServer server(engine, httpServer);

      LOG (INFO) << "Starting JSON-RPC interface on port " << FLAGS_rpc_port;
      server.Run ();

      return EXIT_SUCCESS;
    }
  catch (const UsageError& exc)
    {
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
  catch (const std::exception& exc)
    {
      LOG (ERROR) << exc.what ();
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
}
