#include <gtest/gtest.h>
#include <quartermaster/lifecycle/engine.hpp>
#include <quartermaster/testing/common.hpp>

#include <string>

using namespace quartermaster::schema;
namespace lifecycle = quartermaster::lifecycle;
namespace store = quartermaster::store;
using quartermaster::testing::manual_clock;
using quartermaster::testing::populate_sample;

namespace {

constexpr auto kSignature = "data:image/png;base64,iVBORw0KGgo=";

lifecycle::transition_request make_request(std::string asset_id,
                                           std::string user_name) {
  auto request = lifecycle::transition_request{};
  request.asset_id = std::move(asset_id);
  request.user_name = std::move(user_name);
  request.signature = kSignature;
  return request;
}

void expect_holder_invariant(const store::entity_store& db) {
  for (const auto* value : db.assets()) {
    EXPECT_TRUE(holder_matches_status(*value)) << value->asset_id;
  }
}

}  // namespace

TEST(lifecycle_engine, borrow_marks_asset_and_appends_entry) {
  auto clock = manual_clock{};
  auto db = store::entity_store{clock.clock()};
  ASSERT_TRUE(populate_sample(db));
  auto engine = lifecycle::engine{db};

  auto request = make_request("AST-002", "Alice Chen");
  request.notes = "Project photoshoot";
  auto result = engine.borrow(request);
  ASSERT_TRUE(succeeded(result));

  const auto* camera = db.find_asset("AST-002");
  ASSERT_NE(camera, nullptr);
  EXPECT_EQ(camera->status, asset_status_t::borrowed);
  EXPECT_EQ(camera->current_holder, std::optional<std::string>{"Alice Chen"});

  auto history = db.history("AST-002");
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0]->type, transaction_type_t::borrow);
  EXPECT_EQ(history[0]->transaction_id, *result.entity_id);
  EXPECT_EQ(history[0]->asset_name, "Sony Alpha a7 IV");
  EXPECT_EQ(history[0]->user_id, "U001");
  EXPECT_EQ(history[0]->signature, kSignature);
  EXPECT_EQ(history[0]->notes,
            std::optional<std::string>{"Project photoshoot"});
  EXPECT_EQ(history[0]->timestamp, clock.now());
  expect_holder_invariant(db);
}

TEST(lifecycle_engine, return_clears_holder_and_orders_history) {
  auto clock = manual_clock{};
  auto db = store::entity_store{clock.clock()};
  ASSERT_TRUE(populate_sample(db));
  auto engine = lifecycle::engine{db};

  ASSERT_TRUE(succeeded(engine.borrow(make_request("AST-002", "Alice Chen"))));
  clock.advance(60'000);
  ASSERT_TRUE(
      succeeded(engine.return_asset(make_request("AST-002", "Alice Chen"))));

  const auto* camera = db.find_asset("AST-002");
  EXPECT_EQ(camera->status, asset_status_t::available);
  EXPECT_FALSE(camera->current_holder.has_value());

  auto history = db.history("AST-002");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0]->type, transaction_type_t::return_item);
  EXPECT_EQ(history[1]->type, transaction_type_t::borrow);
  EXPECT_GT(history[0]->timestamp, history[1]->timestamp);
  expect_holder_invariant(db);
}

TEST(lifecycle_engine, wrong_status_is_an_invalid_transition) {
  auto db = store::entity_store{manual_clock{}.clock()};
  ASSERT_TRUE(populate_sample(db));
  auto engine = lifecycle::engine{db};

  auto returned = engine.return_asset(make_request("AST-001", "Alice Chen"));
  EXPECT_EQ(error_of(returned), error_code_t::invalid_transition);
  EXPECT_EQ(returned.info, "asset is Available, expected Borrowed");

  auto borrowed = engine.borrow(make_request("AST-003", "Bob Smith"));
  EXPECT_EQ(error_of(borrowed), error_code_t::invalid_transition);
  EXPECT_EQ(borrowed.info, "asset is Maintenance, expected Available");

  ASSERT_TRUE(succeeded(engine.borrow(make_request("AST-001", "Bob Smith"))));
  auto again = engine.borrow(make_request("AST-001", "Alice Chen"));
  EXPECT_EQ(error_of(again), error_code_t::invalid_transition);
  EXPECT_EQ(db.find_asset("AST-001")->current_holder,
            std::optional<std::string>{"Bob Smith"});
  EXPECT_EQ(db.transactions().size(), 1u);
}

TEST(lifecycle_engine, rejects_missing_assets_users_and_signatures) {
  auto db = store::entity_store{manual_clock{}.clock()};
  ASSERT_TRUE(populate_sample(db));
  auto engine = lifecycle::engine{db};

  EXPECT_EQ(error_of(engine.borrow(make_request("AST-404", "Alice Chen"))),
            error_code_t::not_found);
  EXPECT_EQ(error_of(engine.borrow(make_request("AST-001", ""))),
            error_code_t::invalid_argument);

  auto unsigned_request = make_request("AST-001", "Alice Chen");
  unsigned_request.signature.clear();
  EXPECT_EQ(error_of(engine.borrow(unsigned_request)),
            error_code_t::invalid_argument);
  EXPECT_TRUE(db.transactions().empty());
  EXPECT_EQ(db.find_asset("AST-001")->status, asset_status_t::available);
}

TEST(lifecycle_engine, unregistered_borrowers_are_walk_ins) {
  auto db = store::entity_store{manual_clock{}.clock()};
  ASSERT_TRUE(populate_sample(db));
  auto engine = lifecycle::engine{db};

  ASSERT_TRUE(succeeded(engine.borrow(make_request("AST-004", "Visitor"))));
  EXPECT_EQ(db.transactions().back().user_id, kWalkInUserId);
  EXPECT_EQ(db.find_asset("AST-004")->current_holder,
            std::optional<std::string>{"Visitor"});
}

TEST(lifecycle_engine, maintenance_log_keeps_status) {
  auto db = store::entity_store{manual_clock{}.clock()};
  ASSERT_TRUE(populate_sample(db));
  auto engine = lifecycle::engine{db};

  ASSERT_TRUE(succeeded(engine.borrow(make_request("AST-005", "Alice Chen"))));
  ASSERT_TRUE(succeeded(
      engine.log_maintenance("AST-005", "Bob Smith", "Screen check")));

  const auto* tablet = db.find_asset("AST-005");
  EXPECT_EQ(tablet->status, asset_status_t::borrowed);
  EXPECT_EQ(tablet->current_holder, std::optional<std::string>{"Alice Chen"});
  EXPECT_EQ(db.transactions().back().type, transaction_type_t::maintenance_log);
  EXPECT_EQ(db.transactions().back().user_id, "U002");

  EXPECT_EQ(error_of(engine.log_maintenance("AST-404", "Bob Smith")),
            error_code_t::not_found);
  EXPECT_EQ(error_of(engine.log_maintenance("AST-005", "")),
            error_code_t::invalid_argument);
}

TEST(lifecycle_engine, status_edits_skip_the_ledger) {
  auto db = store::entity_store{manual_clock{}.clock()};
  ASSERT_TRUE(populate_sample(db));
  auto engine = lifecycle::engine{db};

  ASSERT_TRUE(succeeded(engine.borrow(make_request("AST-002", "Alice Chen"))));
  ASSERT_TRUE(succeeded(engine.set_status("AST-002", asset_status_t::lost)));

  const auto* camera = db.find_asset("AST-002");
  EXPECT_EQ(camera->status, asset_status_t::lost);
  EXPECT_FALSE(camera->current_holder.has_value());
  EXPECT_EQ(db.transactions().size(), 1u);

  EXPECT_EQ(error_of(engine.set_status("AST-001", asset_status_t::borrowed)),
            error_code_t::invalid_argument);
  ASSERT_TRUE(succeeded(
      engine.set_status("AST-001", asset_status_t::borrowed, "Carol Admin")));
  EXPECT_EQ(error_of(engine.set_status("AST-404", asset_status_t::lost)),
            error_code_t::not_found);
  expect_holder_invariant(db);
}

TEST(lifecycle_engine, edits_keep_derived_fields) {
  auto db = store::entity_store{manual_clock{}.clock()};
  ASSERT_TRUE(populate_sample(db));
  auto engine = lifecycle::engine{db};

  auto value = *db.find_asset("AST-001");
  value.name = "MacBook Pro 14\"";
  value.qr_code = "tampered";
  value.custom_features["RAM"] = "32GB";
  ASSERT_TRUE(succeeded(engine.edit_asset(value)));

  const auto* edited = db.find_asset("AST-001");
  EXPECT_EQ(edited->name, "MacBook Pro 14\"");
  EXPECT_EQ(edited->qr_code, "qr-AST-001");
  EXPECT_EQ(edited->custom_features.at("RAM"), "32GB");
}
