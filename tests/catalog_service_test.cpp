// =============================================================================
// catalog_service_test.cpp
// =============================================================================
// Unit tests for ledger::CatalogService.
//
// Validates:
//   - Upserts validate ids and thresholds
//   - archiveProduct() blocks adjustments, writes one ARCHIVE marker per
//     stock row, keeps quantities, and emits ProductStatusEvent
//   - restoreProduct() re-enables adjustments with RESTORE markers
//   - Double archive / restore of a live product are rejected
//   - A row created while an archive is in flight fails that archive
//   - purgeProduct() removes product, rows and history
// =============================================================================

#include "ledger/errors/ledger_errors.hpp"
#include "ledger/service/adjustment_service.hpp"
#include "ledger/service/catalog_service.hpp"
#include "ledger/store/in_memory_ledger_store.hpp"
#include "ledger/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <vector>

namespace {

// Runs a hook once, right after the first listing of a product's rows.
class RowListingHookStore : public ledger::InMemoryLedgerStore {
 public:
  std::vector<ledger::domain::StockLevel> stockLevelsForProduct(
      ledger::domain::ProductId product_id) const override {
    auto rows = InMemoryLedgerStore::stockLevelsForProduct(product_id);
    if (after_listing) {
      auto hook = std::move(after_listing);
      after_listing = nullptr;
      hook();
    }
    return rows;
  }

  mutable std::function<void()> after_listing;
};

}  // namespace

class CatalogServiceTest : public ::testing::Test {
 protected:
  ledger::InMemoryLedgerStore store;
  ledger::SimulationTimeProvider clock{2'000};
  std::vector<ledger::Event> emitted;
  ledger::CatalogService catalog{
      store, clock, [this](ledger::Event e) { emitted.push_back(std::move(e)); }};
  ledger::AdjustmentService adjustments{store, clock};

  void SetUp() override {
    catalog.upsertLocation(ledger::domain::Location{1, "Warehouse"});
    catalog.upsertLocation(ledger::domain::Location{2, "Shop"});
    catalog.upsertProduct(ledger::domain::Product{7, "Widget", 3, false});
    adjust(1, 10);
    adjust(2, 4);
  }

  ledger::domain::AdjustmentResult adjust(ledger::domain::LocationId location,
                                          ledger::domain::Quantity delta) {
    ledger::domain::AdjustmentRequest r;
    r.user_id = 1;
    r.product_id = 7;
    r.location_id = location;
    r.delta = delta;
    return adjustments.adjust(r);
  }
};

// -----------------------------------------------------------------------------
// 1. Invalid catalog data is refused.
// -----------------------------------------------------------------------------
TEST_F(CatalogServiceTest, UpsertValidation) {
  EXPECT_THROW(catalog.upsertProduct(ledger::domain::Product{0, "x", 0, false}),
               ledger::InvalidAdjustmentError);
  EXPECT_THROW(catalog.upsertProduct(ledger::domain::Product{8, "x", -1, false}),
               ledger::InvalidAdjustmentError);
  EXPECT_THROW(catalog.upsertLocation(ledger::domain::Location{-2, "x"}),
               ledger::InvalidAdjustmentError);
}

// -----------------------------------------------------------------------------
// 2. Archiving writes a zero-delta marker per row and blocks adjustments.
// -----------------------------------------------------------------------------
TEST_F(CatalogServiceTest, ArchiveWritesMarkersAndBlocks) {
  auto markers = catalog.archiveProduct(5, 7);

  ASSERT_EQ(markers.size(), 2u);
  for (const auto& m : markers) {
    EXPECT_EQ(m.type, ledger::domain::AdjustmentType::Archive);
    EXPECT_EQ(m.delta, 0);
    EXPECT_EQ(m.user_id, 5);
    EXPECT_NE(m.id, 0u);
  }
  EXPECT_TRUE(store.findProduct(7)->archived);
  EXPECT_EQ(store.findStockLevel({7, 1})->quantity, 10);

  try {
    adjust(1, -1);
    FAIL() << "expected ProductNotFoundError";
  } catch (const ledger::ProductNotFoundError& e) {
    EXPECT_TRUE(e.archived());
  }

  ASSERT_EQ(emitted.size(), 1u);
  const auto* status = std::get_if<ledger::ProductStatusEvent>(&emitted[0]);
  ASSERT_NE(status, nullptr);
  EXPECT_TRUE(status->archived);
  EXPECT_EQ(status->product_id, 7);
}

// -----------------------------------------------------------------------------
// 3. Restoring re-enables adjustments; quantities are where they were.
// -----------------------------------------------------------------------------
TEST_F(CatalogServiceTest, RestoreReenables) {
  catalog.archiveProduct(5, 7);
  auto markers = catalog.restoreProduct(5, 7);

  ASSERT_EQ(markers.size(), 2u);
  EXPECT_EQ(markers[0].type, ledger::domain::AdjustmentType::Restore);
  EXPECT_FALSE(store.findProduct(7)->archived);
  EXPECT_EQ(adjust(1, -1).new_quantity, 9);
}

// -----------------------------------------------------------------------------
// 4. State errors: archive twice, restore a live product, unknown product.
// -----------------------------------------------------------------------------
TEST_F(CatalogServiceTest, LifecycleStateErrors) {
  EXPECT_THROW(catalog.restoreProduct(5, 7), ledger::InvalidAdjustmentError);
  catalog.archiveProduct(5, 7);
  EXPECT_THROW(catalog.archiveProduct(5, 7), ledger::InvalidAdjustmentError);
  EXPECT_THROW(catalog.archiveProduct(5, 99), ledger::ProductNotFoundError);
}

// -----------------------------------------------------------------------------
// 5. A product without stock rows archives with no markers.
// -----------------------------------------------------------------------------
TEST_F(CatalogServiceTest, ArchiveWithoutRows) {
  catalog.upsertProduct(ledger::domain::Product{8, "Fresh", 0, false});
  EXPECT_TRUE(catalog.archiveProduct(5, 8).empty());
  EXPECT_TRUE(store.findProduct(8)->archived);
}

// -----------------------------------------------------------------------------
// 6. Purge removes everything; purging again is NOT_FOUND.
// -----------------------------------------------------------------------------
TEST_F(CatalogServiceTest, PurgeRemovesEverything) {
  catalog.purgeProduct(7);
  EXPECT_FALSE(store.findProduct(7).has_value());
  EXPECT_TRUE(store.stockLevelsForProduct(7).empty());
  EXPECT_EQ(store.logSize(), 0u);
  EXPECT_THROW(catalog.purgeProduct(7), ledger::ProductNotFoundError);
}

// -----------------------------------------------------------------------------
// 7. A stock row created between listing and commit aborts the archive.
// Why: The product would otherwise be archived with a row that has no
//      ARCHIVE marker in its history.
// -----------------------------------------------------------------------------
TEST(CatalogServiceRaceTest, RowCreatedDuringArchiveFailsTheArchive) {
  RowListingHookStore store;
  ledger::SimulationTimeProvider clock{2'000};
  ledger::CatalogService catalog{store, clock};
  ledger::AdjustmentService adjustments{store, clock};
  catalog.upsertLocation(ledger::domain::Location{1, "Warehouse"});
  catalog.upsertLocation(ledger::domain::Location{2, "Shop"});
  catalog.upsertProduct(ledger::domain::Product{7, "Widget", 0, false});

  ledger::domain::AdjustmentRequest r;
  r.user_id = 1;
  r.product_id = 7;
  r.location_id = 1;
  r.delta = 10;
  adjustments.adjust(r);

  store.after_listing = [&adjustments, r]() mutable {
    r.location_id = 2;
    r.delta = 5;
    adjustments.adjust(r);
  };

  EXPECT_THROW(catalog.archiveProduct(1, 7), ledger::OptimisticLockError);
  EXPECT_FALSE(store.findProduct(7)->archived);
  EXPECT_EQ(store.logSize(), 2u);

  // Retrying sees both rows.
  auto markers = catalog.archiveProduct(1, 7);
  EXPECT_EQ(markers.size(), 2u);
  EXPECT_TRUE(store.findProduct(7)->archived);
}
