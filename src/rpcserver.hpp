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

#ifndef EMPORIUM_RPCSERVER_HPP
#define EMPORIUM_RPCSERVER_HPP

#include "engine.hpp"
#include "rpc-stubs/emporiumrpcserverstub.h"

#include <json/json.h>
#include <jsonrpccpp/server.h>

#include <condition_variable>
#include <mutex>
#include <string>

namespace emporium
{

/**
 * JSON-RPC server exposing an Engine.  All methods (except stop) return
 * an envelope object with "success", "data" and "error" fields.  Domain
 * and database errors are reported through the envelope rather than
 * as JSON-RPC errors.
 */
class RpcServer : public EmporiumRpcServerStub
{

private:

  /** The Engine this is for.  */
  Engine& engine;

  /** Flag set to indicate the server should shut down.  */
  bool shouldStop;

  /** Mutex for the stop flag.  */
  std::mutex mutStop;

  /** Condition variable for signalling "should stop".  */
  std::condition_variable cvStop;

  /**
   * Runs the given function and wraps its result (or the error it throws)
   * into the response envelope.
   */
  template <typename Fcn>
    static Json::Value Envelope (const std::string& method, const Fcn& fcn);

public:

  explicit RpcServer (Engine& e, jsonrpc::AbstractServerConnector& conn)
    : EmporiumRpcServerStub(conn), engine(e)
  {}

  RpcServer () = delete;
  RpcServer (const RpcServer&) = delete;
  void operator= (const RpcServer&) = delete;

  /**
   * Starts the server and blocks until it gets shut down again.
   */
  void Run ();

  void stop () override;
  Json::Value getstatus () override;

  Json::Value openaccount (const std::string& competitor,
                           const std::string& game,
                           int initialBalance) override;
  Json::Value getbalance (const std::string& competitor) override;
  Json::Value getcurrencyhistory (const std::string& competitor, int limit,
                                  int offset) override;
  Json::Value transfer (const std::string& from, const std::string& to,
                        int amount, const std::string& reason) override;

  Json::Value getinventory (const std::string& competitor,
                            bool includeEmpty) override;
  Json::Value useitem (const std::string& competitor, const std::string& item,
                       int quantity) override;
  Json::Value purchaseitem (const std::string& competitor,
                            const std::string& item, int quantity) override;

  Json::Value createtrade (const std::string& from, const std::string& to,
                           const Json::Value& items, int offeredCurrency,
                           int requestedCurrency) override;
  Json::Value respondtotrade (int id, const std::string& responder,
                              bool accept) override;
  Json::Value canceltrade (int id, const std::string& requester) override;
  Json::Value gettrade (int id) override;
  Json::Value listtrades (const std::string& competitor,
                          bool pendingOnly) override;

  Json::Value awardseasonxp (const std::string& competitor,
                             const std::string& season, int amount,
                             const std::string& source) override;
  Json::Value claimseasonreward (const std::string& competitor,
                                 const std::string& season,
                                 int tier) override;
  Json::Value purchasebattlepass (const std::string& competitor,
                                  const std::string& season,
                                  int price) override;
  Json::Value getseasonprogression (const std::string& competitor,
                                    const std::string& season) override;

  Json::Value claimdailyreward (const std::string& competitor) override;

};

} // namespace emporium

#endif // EMPORIUM_RPCSERVER_HPP
