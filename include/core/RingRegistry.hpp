#pragma once
/** @file  RingRegistry.hpp
 *  @brief Authoritative ring id -> address/name/status table, persisted as JSON.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

// Zeddring headers
#include "core/Errors.hpp"
#include "core/Types.hpp"

namespace zeddring {
  namespace core {

    /**
 * @class RingRegistry
 * @brief Owns every Ring record; everybody else gets copies.
 *
 *  * Readers take a shared lock, writers an exclusive one, so a reader never
 *    sees a half-updated record.
 *  * register/rename/remove rewrite the JSON document (tmp file + rename)
 *    before returning. Status and readings only mark the document dirty;
 *    `flush()` writes them out (the scheduler calls it once per tick).
 *  * An empty path keeps the registry in memory only.
 */
    class RingRegistry {
    public:
      explicit RingRegistry(std::string storePath, std::string defaultName = "Colmi R02");
      ~RingRegistry() = default;

      RingRegistry(const RingRegistry&) = delete;
      RingRegistry& operator=(const RingRegistry&) = delete;

      //---durability---------------------------------------------------------
      /// Load the JSON document if it exists. Throws StorageError on a corrupt file.
      void load();
      /// Persist pending status/readings updates. Throws StorageError.
      void flush();

      //---public API---------------------------------------------------------
      /// @throws RingError DuplicateAddress / InvalidArgument, StorageError
      RingId registerRing(const std::string& address,
                          const std::optional<std::string>& name = std::nullopt);
      /// @throws RingError NotFound / InvalidArgument, StorageError
      void rename(RingId id, const std::string& name);
      /// Marks the ring pending-deletion and drops it from the durable document.
      /// The in-memory record lives on until purge(). @throws RingError NotFound
      void remove(RingId id);
      /// Forget the record entirely; false if it was already gone.
      bool purge(RingId id);

      std::optional<Ring> get(RingId id) const;
      std::optional<Ring> findByAddress(const std::string& address) const;
      /// Snapshot in insertion order, pending-deletion rings excluded.
      std::vector<Ring> list() const;

      //---updates from the state machine / poller----------------------------
      bool updateStatus(RingId id, const RingStatus& status);
      bool recordReading(RingId id, Metric metric, std::int64_t value);

      /// Upper-cases and validates "AA:BB:CC:DD:EE:FF"; std::nullopt if malformed.
      static std::optional<std::string> normaliseAddress(const std::string& address);

    private:
      Ring* findLocked(RingId id);
      const Ring* findLocked(RingId id) const;
      void persistLocked(); ///< caller holds the exclusive lock

      std::string path_;
      std::string defaultName_;
      mutable std::shared_mutex mtx_;
      std::vector<Ring> rings_{}; ///< insertion order
      RingId nextId_{ 1 };
      bool dirty_{ false };
    };

  } // namespace core
} // namespace zeddring
