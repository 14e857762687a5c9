#include "trellis/store.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "trellis/handle.hpp"

namespace trellis {

namespace {

struct InventoryTag {};
struct BillingTag {};

struct Counter {
  int value;
};

}  // namespace

TEST(Store, AddReturnsTypedHandles) {
  auto [s1, intHandle] = NewStore<InventoryTag>().add(42);
  auto [s2, strHandle] = std::move(s1).add(std::string("crate"));
  auto [store, counterHandle] = std::move(s2).add(Counter{7});

  static_assert(std::is_same_v<decltype(intHandle)::value_type, int>);
  static_assert(std::is_same_v<decltype(strHandle)::value_type, std::string>);
  static_assert(decltype(counterHandle)::kIndex == 2);
  static_assert(decltype(store)::kNbSlots == 3);

  EXPECT_EQ(store.borrow(intHandle), 42);
  EXPECT_EQ(store.borrow(strHandle), "crate");
  EXPECT_EQ(store.borrow(counterHandle).value, 7);
}

TEST(Store, HandlesRemainValidInDescendantStores) {
  auto [s1, first] = NewStore<InventoryTag>().add(1);
  auto [s2, second] = std::move(s1).add(2);
  auto [s3, third] = std::move(s2).add(3);

  EXPECT_EQ(s3.borrow(first), 1);
  EXPECT_EQ(s3.borrow(second), 2);
  EXPECT_EQ(s3.borrow(third), 3);
}

TEST(Store, SameTypeInSeveralSlotsIsAddressedByPosition) {
  auto [s1, low] = NewStore<InventoryTag>().add(std::string("low"));
  auto [store, high] = std::move(s1).add(std::string("high"));
  EXPECT_EQ(store.borrow(low), "low");
  EXPECT_EQ(store.borrow(high), "high");
}

TEST(Store, FrozenSnapshotIsSharedReadOnly) {
  auto [s1, handle] = NewStore<BillingTag>().add(std::string("invoice"));
  std::shared_ptr<const Store<BillingTag, std::string>> frozen = Freeze(std::move(s1));
  auto copy = frozen;
  EXPECT_EQ(copy->borrow(handle), "invoice");
  EXPECT_EQ(&frozen->borrow(handle), &copy->borrow(handle));
}

TEST(Store, MoveOnlyValues) {
  auto [store, handle] = NewStore<BillingTag>().add(std::make_unique<int>(5));
  EXPECT_EQ(*store.borrow(handle), 5);
}

// Compile-time lineage checks: handles of one store cannot be presented to another one.
namespace {

using InventoryStore = decltype(NewStore<InventoryTag>().add(0).first);
using InventoryHandle = decltype(NewStore<InventoryTag>().add(0).second);
using BillingStore = decltype(NewStore<BillingTag>().add(0).first);
using BillingHandle = decltype(NewStore<BillingTag>().add(0).second);

using GrownInventoryStore = decltype(std::declval<InventoryStore>().add(std::string()).first);
using StringHandleAtOne = decltype(std::declval<InventoryStore>().add(std::string()).second);

static_assert(BorrowableFrom<InventoryStore, InventoryHandle>);
static_assert(BorrowableFrom<BillingStore, BillingHandle>);
static_assert(!BorrowableFrom<InventoryStore, BillingHandle>);
static_assert(!BorrowableFrom<BillingStore, InventoryHandle>);

// a handle of a later slot cannot be used on an ancestor store
static_assert(BorrowableFrom<GrownInventoryStore, InventoryHandle>);
static_assert(BorrowableFrom<GrownInventoryStore, StringHandleAtOne>);
static_assert(!BorrowableFrom<InventoryStore, StringHandleAtOne>);

// handles cannot be forged
static_assert(!std::is_default_constructible_v<InventoryHandle>);
static_assert(std::is_empty_v<InventoryHandle>);
static_assert(!std::is_default_constructible_v<InventoryStore>);

}  // namespace

TEST(Store, ForeignHandlesAreRejectedAtCompileTime) {
  // The static_asserts above are the actual checks; this test documents them in the test report.
  EXPECT_FALSE((BorrowableFrom<InventoryStore, BillingHandle>));
  EXPECT_TRUE((BorrowableFrom<InventoryStore, InventoryHandle>));
}

TEST(Store, IndependentStoresNeedTheirOwnTag) {
  struct CacheTag {};
  struct SessionTag {};
  auto [cache, cacheHandle] = NewStore<CacheTag>().add(std::string("cache"));
  auto [session, sessionHandle] = NewStore<SessionTag>().add(std::string("session"));
  static_assert(!BorrowableFrom<decltype(cache), decltype(sessionHandle)>);
  static_assert(!BorrowableFrom<decltype(session), decltype(cacheHandle)>);
  EXPECT_EQ(cache.borrow(cacheHandle), "cache");
  EXPECT_EQ(session.borrow(sessionHandle), "session");

  // Same tag, same slot layout: the stores cannot be told apart.
  auto [other, otherHandle] = NewStore<CacheTag>().add(std::string("other"));
  static_assert(std::is_same_v<decltype(cache), decltype(other)>);
  EXPECT_EQ(cache.borrow(otherHandle), "cache");
}

}  // namespace trellis
