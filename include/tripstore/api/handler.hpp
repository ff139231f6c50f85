/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file handler.hpp
 * @brief JSON command dispatcher over the trip service.
 *
 * @details
 * The `Handler` is the single entry point of the command surface. It takes
 * one request line, decodes it, routes it to `service::TripService` or to the
 * backup catalog, and marshals the outcome (or the typed error) back into one
 * JSON response line.
 */

#pragma once

#include "tripstore/service/trip_service.hpp"
#include "tripstore/storage/backup_catalog.hpp"

#include <string>

namespace tripstore::api {

/**
 * @class Handler
 * @brief Decodes requests, dispatches them and encodes responses.
 *
 * **Response Formats:**
 * - **Success:** `{"status": "ok", "data": <result>}`
 * - **Error:** `{"status": "error", "code": "<ERROR_CODE>", "message": "...", "violations": [...]}`
 * - **Exit:** `{"status": "goodbye", "message": "Closing connection"}`
 *
 * @code
 * {"action": "link_expense", "tripId": "trip-1", "expenseId": "exp-1",
 *  "travelItemType": "location", "travelItemId": "loc-1"}
 * @endcode
 */
class Handler {
  public:
    /**
     * @param service The trip operations.
     * @param gc_defaults Retention policy used by `gc_backups` when the request
     * names none.
     */
    explicit Handler(service::TripService& service, storage::GcOptions gc_defaults = {})
        : service_(service), gc_defaults_(gc_defaults)
    {
    }

    /**
     * @brief Processes one raw request.
     * @return std::string Compact JSON response; never throws for bad input.
     */
    std::string process(const std::string& raw_json);

    /// @brief True when @p response is the reply to an `exit` request.
    static bool is_goodbye(const std::string& response);

  private:
    service::TripService& service_;
    storage::GcOptions gc_defaults_;
};

} // namespace tripstore::api
