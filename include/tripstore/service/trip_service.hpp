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
 * @file trip_service.hpp
 * @brief Caller-facing operations on trips.
 *
 * @details
 * The service combines the store, the boundary validator, the link tooling
 * and the migration repair routines into the operations a front end needs.
 * Every mutation follows the same pattern:
 * 1. load the trip (migrated and repaired);
 * 2. apply the change to a copy;
 * 3. validate; on failure report every violation and write nothing;
 * 4. run the integrity sweep so both halves of each link agree;
 * 5. save.
 *
 * Mutations of one trip are serialized inside the service, so concurrent
 * read-modify-write cycles cannot lose each other's changes.
 */

#pragma once

#include "tripstore/links/boundary_validator.hpp"
#include "tripstore/links/link_index.hpp"
#include "tripstore/model/trip.hpp"
#include "tripstore/storage/store.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tripstore::service {

/**
 * @struct ItineraryPatch
 * @brief Replacement values for the itinerary side; absent members are kept.
 */
struct ItineraryPatch {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> start_date;
    std::optional<std::string> end_date;
    std::optional<std::vector<model::Location>> locations;
    std::optional<std::vector<model::Route>> routes;
    std::optional<std::string> days_json;
    std::optional<std::vector<model::Accommodation>> accommodations;
};

/**
 * @struct FinancePatch
 * @brief Replacement values for the finance section; absent members are kept.
 */
struct FinancePatch {
    std::optional<double> overall_budget;
    std::optional<double> reserved_budget;
    std::optional<std::string> currency;
    std::optional<std::vector<model::BudgetItem>> country_budgets;
    std::optional<std::vector<model::Expense>> expenses;
    std::optional<std::vector<std::string>> custom_categories;
    std::optional<model::ImportMetadata> import_metadata;
};

struct ImportReport {
    std::vector<std::string> added_ids;
    std::size_t skipped = 0; ///< Duplicates by import hash or external transaction id.
};

/**
 * @class TripService
 * @brief Stateless apart from per-trip edit locks; all state lives in the store.
 */
class TripService {
  public:
    explicit TripService(storage::Store& store) : store_(store) {}

    /// @brief Loaded, migrated document, or `std::nullopt`.
    std::optional<model::TripDocument> load_document(const std::string& trip_id);

    /**
     * @brief Persists a caller-built document.
     *
     * A missing schema version is taken to be the current one; older versions
     * are migrated before the write.
     * @throws InvalidSchemaVersionError for versions newer than current.
     */
    void save_document(model::TripDocument doc);

    /**
     * @brief Creates and persists an empty trip.
     * @throws ValidationError (`VALIDATION`) if @p title is blank.
     */
    model::TripDocument create_trip(const std::string& title, const std::string& description,
                                    const std::string& start_date, const std::string& end_date);

    /**
     * @brief Replaces itinerary members and merges accommodations.
     *
     * Incoming accommodations replace stored ones with the same id unless the
     * stored copy has a newer `updatedAt`; stored accommodations missing from
     * the payload survive while a location or an expense still references
     * them. Change notices are prepended to `publicUpdates`.
     *
     * @throws NotFoundError (`TRIP_NOT_FOUND`).
     * @throws ValidationError (`CROSS_TRIP_EXPENSE`) listing every link whose
     * expense is not in this trip.
     */
    model::TripDocument update_itinerary(const std::string& trip_id, const ItineraryPatch& patch);

    /**
     * @brief Replaces finance members; links left without an expense are purged.
     *
     * @throws NotFoundError (`TRIP_NOT_FOUND`).
     * @throws ValidationError (`CROSS_TRIP_TRAVEL_ITEM`) listing every expense
     * reference to an item outside this trip.
     */
    model::TripDocument update_finance(const std::string& trip_id, const FinancePatch& patch);

    /// @throws NotFoundError (`TRIP_NOT_FOUND`).
    links::LinkValidation validate_link(const std::string& trip_id, const std::string& expense_id,
                                        const std::optional<links::ItemRef>& target);

    /**
     * @brief Links (or with no @p target unlinks) an expense and persists the trip.
     * @throws ValidationError carrying the boundary violations.
     */
    model::TripDocument link_expense(const std::string& trip_id, const std::string& expense_id,
                                     const std::optional<links::ItemRef>& target);

    /// @brief Index over the trip's itinerary, hydrated from expense references.
    links::LinkIndex build_link_index(const std::string& trip_id);

    /**
     * @brief Appends already-parsed bank-statement expenses.
     *
     * Duplicates (same `importHash` or `externalTransactionId` as a stored
     * expense or a previously imported hash) are skipped.
     */
    ImportReport import_expenses(const std::string& trip_id, std::vector<model::Expense> expenses);

    std::vector<storage::TripSummary> list_trips() const { return store_.list_trips(); }

    storage::BackupRecord delete_trip(const std::string& trip_id, const std::string& reason);
    storage::BackupRecord delete_finance(const std::string& trip_id, const std::string& reason);
    model::TripDocument restore_trip(const std::string& backup_id, bool overwrite);
    model::TripDocument restore_finance(const std::string& backup_id,
                                        const std::string& target_trip_id, bool overwrite);

    storage::Store& store() { return store_; }

    /// @brief Number of trips with an edit in flight.
    std::size_t edit_lock_count();

  private:
    /**
     * @brief Holds a trip's edit lock for one mutation.
     *
     * The map entry is dropped on release unless another request holds it.
     */
    class EditGuard {
      public:
        EditGuard(TripService& service, const std::string& trip_id);
        ~EditGuard();

        EditGuard(const EditGuard&) = delete;
        EditGuard& operator=(const EditGuard&) = delete;

      private:
        TripService& service_;
        std::string trip_id_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    model::TripDocument require(const std::string& trip_id);
    model::TripDocument commit(model::TripDocument doc);

    storage::Store& store_;
    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace tripstore::service
