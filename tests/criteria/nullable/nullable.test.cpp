// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <any>
#include <memory>
#include <optional>
#include <string>

#include <criteria/nullable/narrow.hpp>
#include <criteria/nullable/nullable.hpp>

using namespace criteria;

namespace {
  struct base {
    virtual ~base() = default;
  };

  struct left : base {};

  struct right : base {};

  // A user type with its own null state.
  struct handle_id {
    int value = -1;

    friend bool operator==(const handle_id&, const handle_id&) = default;
  };
} // namespace

template <> struct criteria::nullable_traits<handle_id> {
  static constexpr inline bool is_nullable = true;

  [[nodiscard]] static constexpr bool is_null(const handle_id& id) noexcept
  {
    return id.value < 0;
  }

  [[nodiscard]] static constexpr handle_id null() noexcept { return {}; }
};

TEST_CASE("nullable_traits: classification", "[nullable]")
{
  STATIC_REQUIRE(is_nullable_v<int*>);
  STATIC_REQUIRE(is_nullable_v<std::shared_ptr<int>>);
  STATIC_REQUIRE(is_nullable_v<std::unique_ptr<int>>);
  STATIC_REQUIRE(is_nullable_v<std::optional<int>>);
  STATIC_REQUIRE(is_nullable_v<std::optional<int*>>);
  STATIC_REQUIRE(is_nullable_v<std::any>);
  STATIC_REQUIRE(is_nullable_v<const char*>);
  STATIC_REQUIRE(is_nullable_v<handle_id>);

  STATIC_REQUIRE_FALSE(is_nullable_v<int>);
  STATIC_REQUIRE_FALSE(is_nullable_v<std::string>);
}

TEST_CASE("nullable_traits: null markers", "[nullable]")
{
  CHECK(null_value<std::shared_ptr<int>>() == nullptr);
  CHECK_FALSE(null_value<std::optional<int>>().has_value());
  CHECK_FALSE(null_value<std::any>().has_value());
  CHECK(null_value<int>() == 0);
  CHECK(null_value<std::string>().empty());
  CHECK(null_value<handle_id>() == handle_id{});

  CHECK(is_null_value(handle_id{}));
  CHECK_FALSE(is_null_value(handle_id{3}));
  CHECK_FALSE(is_null_value(std::string{}));
}

TEST_CASE("narrow: identity", "[nullable][narrow]")
{
  auto value = std::string{"same"};
  CHECK(&narrow<std::string>(value) == &value);
}

TEST_CASE("narrow: std::any", "[nullable][narrow]")
{
  CHECK(narrow<int>(std::any{7}) == 7);
  CHECK(narrow<std::string>(std::any{std::string{"s"}}) == "s");

  SECTION("Empty any narrows to a null marker")
  {
    CHECK(narrow<std::shared_ptr<int>>(std::any{}) == nullptr);
    CHECK_FALSE(narrow<std::optional<int>>(std::any{}).has_value());
  }

  SECTION("Empty any has no value for non-nullable targets")
  {
    CHECK_THROWS_AS(narrow<int>(std::any{}), type_mismatch);
  }

  SECTION("Wrong held type")
  {
    CHECK_THROWS_AS(narrow<int>(std::any{std::string{"s"}}), type_mismatch);
    CHECK_THROWS_AS(narrow<int>(std::any{std::string{"s"}}), std::bad_cast);
    CHECK_THROWS_WITH(narrow<int>(std::any{2.0}),
      Catch::Matchers::ContainsSubstring("double")
        && Catch::Matchers::ContainsSubstring("int"));
  }
}

TEST_CASE("narrow: shared_ptr downcast", "[nullable][narrow]")
{
  auto value = std::shared_ptr<base>{std::make_shared<left>()};

  auto narrowed = narrow<std::shared_ptr<left>>(value);
  CHECK(narrowed.get() == value.get());

  CHECK(narrow<std::shared_ptr<left>>(std::shared_ptr<base>{}) == nullptr);
  CHECK_THROWS_AS(narrow<std::shared_ptr<right>>(value), type_mismatch);
}
