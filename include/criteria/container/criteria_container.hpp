// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CRITERIA_CONTAINER_CRITERIA_CONTAINER_HPP
#define CRITERIA_CONTAINER_CRITERIA_CONTAINER_HPP

#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index_container.hpp>

#include <range/v3/view/all.hpp>
#include <range/v3/view/transform.hpp>

#include <criteria/container/key_ref.hpp>
#include <criteria/errors/errors.hpp>
#include <criteria/functional/functional.hpp>
#include <criteria/nullable/narrow.hpp>
#include <criteria/nullable/nullable.hpp>

namespace criteria {

  /**
   * @brief A single key/value record, as exposed by iteration.
   */
  template <typename V> struct entry {
    std::string key;
    V           value;

    friend bool operator==(const entry&, const entry&) = default;
  };

  namespace detail {

    /**
     * @brief Transparent hasher so lookups by std::string_view need not
     * materialize a std::string.
     */
    struct string_hash {
      using is_transparent = void;

      [[nodiscard]] auto operator()(std::string_view key) const noexcept
        -> std::size_t
      {
        return std::hash<std::string_view>{}(key);
      }
    };

    // Tags for Boost.MultiIndex
    struct by_insertion {};

    struct by_key {};

    template <typename V>
    using entry_storage_t = boost::multi_index_container<entry<V>,
      boost::multi_index::indexed_by<
        boost::multi_index::sequenced<boost::multi_index::tag<by_insertion>>,
        boost::multi_index::hashed_unique<boost::multi_index::tag<by_key>,
          boost::multi_index::member<entry<V>, std::string, &entry<V>::key>,
          string_hash,
          std::equal_to<>>>>;

    // Source mappings yield either criteria entries or pair-like records.

    template <typename E>
      requires requires(const E& e) {
        e.key;
        e.value;
      }
    constexpr auto entry_key(const E& e) noexcept -> decltype((e.key))
    {
      return e.key;
    }

    template <typename E>
      requires requires(const E& e) {
        e.first;
        e.second;
      }
    constexpr auto entry_key(const E& e) noexcept -> decltype((e.first))
    {
      return e.first;
    }

    template <typename E>
      requires requires(const E& e) {
        e.key;
        e.value;
      }
    constexpr auto entry_value(const E& e) noexcept -> decltype((e.value))
    {
      return e.value;
    }

    template <typename E>
      requires requires(const E& e) {
        e.first;
        e.second;
      }
    constexpr auto entry_value(const E& e) noexcept -> decltype((e.second))
    {
      return e.second;
    }

    template <typename R>
    using entry_value_t = std::remove_cvref_t<decltype(entry_value(
      std::declval<std::ranges::range_reference_t<const R>>()))>;

    template <typename R>
    void require_non_null_keys(std::string_view where, const R& source)
    {
      for (const auto& element : source) {
        if (key_ref{entry_key(element)}.is_null()) {
          throw_null_source_key(where);
        }
      }
    }

  } // namespace detail

  namespace concepts {

    /**
     * @brief A multi-pass range of key/value records whose keys can be
     * passed as key_ref and whose values can be stored as V.
     *
     * Multi-pass so that null keys are rejected before anything is applied.
     */
    template <typename R, typename V>
    concept entry_range =
      std::ranges::forward_range<const R>
      && requires(std::ranges::range_reference_t<const R> element) {
           { detail::entry_key(element) } -> std::convertible_to<key_ref>;
           detail::entry_value(element);
         }
      && std::constructible_from<V, const detail::entry_value_t<R>&>;

  } // namespace concepts

  // =============================================================================
  // criteria_container
  // =============================================================================

  /**
   * @brief Insertion-ordered map from string keys to V, decorated with
   * predicate-gated insertion, lookup and callback operations.
   *
   * Keys are unique and never null. Overwriting a key keeps its original
   * position. Values may be null when V is nullable (see nullable_traits);
   * get() does not distinguish a stored null from an absent key, while
   * get_optional() reports both as empty.
   *
   * Not thread-safe: concurrent readers are fine, writers need external
   * synchronization.
   *
   * @tparam V The stored value type.
   */
  template <typename V>
    requires std::copyable<V> && std::default_initializable<V>
  class criteria_container {
    using storage_type = detail::entry_storage_t<V>;

  public:
    using key_type       = std::string;
    using mapped_type    = V;
    using value_type     = entry<V>;
    using size_type      = std::size_t;
    using const_iterator = typename storage_type::const_iterator;
    using iterator       = const_iterator;

    [[nodiscard]] criteria_container() = default;

    // --- Construction ---

    [[nodiscard]] static auto create() -> criteria_container
    {
      return criteria_container{};
    }

    [[nodiscard]] static auto create(size_type initial_capacity)
      -> criteria_container
    {
      auto result = criteria_container{};
      result.reserve(initial_capacity);
      return result;
    }

    /**
     * @brief Copies every record of @p source into a new container.
     *
     * Later records overwrite earlier ones with the same key. The result
     * owns its storage and is unaffected by later changes to @p source.
     *
     * @throws std::invalid_argument if @p source holds a null key, or a
     * null value that V cannot represent.
     */
    template <concepts::entry_range<V> R>
    [[nodiscard]] static auto from(const R& source) -> criteria_container
    {
      constexpr auto where = "criteria_container::from";

      require_storable(where, source);

      auto result = criteria_container{};
      if constexpr (std::ranges::sized_range<const R>) {
        result.reserve(std::ranges::size(source));
      }
      result.assign_all(where, source);
      return result;
    }

    /// @throws std::invalid_argument if @p source is null or holds a null key.
    template <concepts::entry_range<V> R>
    [[nodiscard]] static auto from(const R* source) -> criteria_container
    {
      if (source == nullptr) {
        detail::throw_null_argument("criteria_container::from", "source");
      }
      return from(*source);
    }

    // --- Capacity ---

    [[nodiscard]] auto size() const noexcept -> size_type
    {
      return entries_.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool
    {
      return entries_.empty();
    }

    auto reserve(size_type count) -> void
    {
      entries_.template get<detail::by_key>().reserve(count);
    }

    // --- Lookup ---

    [[nodiscard]] auto contains_key(key_ref key) const -> bool
    {
      return lookup(key.value("criteria_container::contains_key")) != nullptr;
    }

    /// Alias of contains_key().
    [[nodiscard]] auto has(key_ref key) const -> bool
    {
      return lookup(key.value("criteria_container::has")) != nullptr;
    }

    [[nodiscard]] auto contains_value(const V& value) const -> bool
      requires std::equality_comparable<V>
    {
      for (const auto& stored : entries_) {
        if (stored.value == value) {
          return true;
        }
      }
      return false;
    }

    /**
     * @brief Returns a copy of the stored value, or the null marker of V if
     * the key is absent.
     */
    [[nodiscard]] auto get(key_ref key) const -> V
    {
      const auto* value = lookup(key.value("criteria_container::get"));
      return value != nullptr ? *value : null_value<V>();
    }

    [[nodiscard]] auto get_or(key_ref key, V fallback) const -> V
    {
      const auto* value = lookup(key.value("criteria_container::get_or"));
      return value != nullptr ? *value : std::move(fallback);
    }

    [[nodiscard]] auto find(key_ref key) const -> const V*
    {
      return lookup(key.value("criteria_container::find"));
    }

    [[nodiscard]] auto at(key_ref key) const -> const V&
    {
      constexpr auto where = "criteria_container::at";

      auto name = key.value(where);
      if (const auto* value = lookup(name)) {
        return *value;
      }
      detail::throw_key_not_found(where, name);
    }

    /**
     * @brief Returns the stored value only if it is present and not null.
     *
     * A null key yields an empty optional rather than an exception.
     */
    [[nodiscard]] auto get_optional(key_ref key) const -> std::optional<V>
    {
      const auto* value = lookup_nullable(key);
      if (value == nullptr || is_null_value(*value)) {
        return std::nullopt;
      }
      return *value;
    }

    // --- Mutation ---

    /**
     * @brief Stores @p value under @p key.
     * @return The previously stored value, or the null marker of V.
     */
    auto put(key_ref key, V value) -> V
    {
      return assign(key.value("criteria_container::put"), std::move(value));
    }

    /**
     * @brief Removes the record for @p key.
     * @return The removed value, or the null marker of V.
     */
    auto remove(key_ref key) -> V
    {
      auto& index = entries_.template get<detail::by_key>();
      auto  it    = locate(key.value("criteria_container::remove"));

      if (it == index.end()) {
        return null_value<V>();
      }

      auto removed = it->value;
      index.erase(it);
      return removed;
    }

    auto clear() noexcept -> void { entries_.clear(); }

    /**
     * @brief Merges every record of @p source, overwriting on collision.
     *
     * Keys are validated before any record is applied.
     *
     * @throws std::invalid_argument if @p source holds a null key, or a
     * null value that V cannot represent.
     */
    template <concepts::entry_range<V> R> auto put_all(const R& source) -> void
    {
      constexpr auto where = "criteria_container::put_all";

      require_storable(where, source);
      assign_all(where, source);
    }

    template <concepts::entry_range<V> R> auto put_all(const R* source) -> void
    {
      if (source == nullptr) {
        detail::throw_null_argument("criteria_container::put_all", "source");
      }
      put_all(*source);
    }

    // --- Conditional insertion ---

    /**
     * @brief Stores @p value under @p key if every predicate accepts it.
     *
     * All predicates are checked for null before any is evaluated. They
     * are then tested left to right against the candidate (as E, before
     * conversion to V), stopping at the first rejection. The key is
     * validated by the store itself, so a null key is only reported when
     * the predicates pass. An accepted null candidate is stored as the null
     * marker of V.
     *
     * @return True if the value was stored.
     * @throws std::invalid_argument on a null predicate, or a null key for
     * an accepted value, or an accepted null candidate when V has no null
     * state.
     */
    template <typename E, typename... Ps>
      requires std::constructible_from<V, std::decay_t<E>>
            && (concepts::predicate_for<Ps, std::decay_t<E>> && ...)
    auto put_if(key_ref key, E&& value, const Ps&... predicates) -> bool
    {
      constexpr auto where = "criteria_container::put_if";

      detail::require_predicates(where, predicates...);

      auto candidate = std::decay_t<E>(std::forward<E>(value));
      if (!detail::test_all(where, candidate, predicates...)) {
        return false;
      }

      put(key, to_stored(where, std::move(candidate)));
      return true;
    }

    /// Runtime-composed predicate list; same contract as the variadic form.
    template <typename E, concepts::predicate_range<std::decay_t<E>> P>
      requires std::constructible_from<V, std::decay_t<E>>
    auto put_if(key_ref key, E&& value, const P& predicates) -> bool
    {
      constexpr auto where = "criteria_container::put_if";

      detail::require_predicate_range(where, predicates);

      auto candidate = std::decay_t<E>(std::forward<E>(value));
      if (!detail::test_range(where, candidate, predicates)) {
        return false;
      }

      put(key, to_stored(where, std::move(candidate)));
      return true;
    }

    template <typename E, concepts::predicate_range<std::decay_t<E>> P>
      requires std::constructible_from<V, std::decay_t<E>>
    auto put_if(key_ref key, E&& value, const P* predicates) -> bool
    {
      if (predicates == nullptr) {
        detail::throw_null_argument("criteria_container::put_if", "predicates");
      }
      return put_if(key, std::forward<E>(value), *predicates);
    }

    /**
     * @brief Stores each record of @p source whose value passes every
     * predicate.
     *
     * Records are judged independently and in the source's iteration
     * order; rejected records are skipped silently. Predicates are
     * null-checked as they are evaluated.
     *
     * @throws std::invalid_argument if @p source holds a null key, a null
     * predicate is reached, or an accepted value is null and V has no null
     * state.
     */
    template <concepts::entry_range<V> R, typename... Ps>
      requires(concepts::predicate_for<Ps, detail::entry_value_t<R>> && ...)
    auto put_all_if(const R& source, const Ps&... predicates) -> void
    {
      constexpr auto where = "criteria_container::put_all_if";

      detail::require_non_null_keys(where, source);

      for (const auto& element : source) {
        const auto& value = detail::entry_value(element);
        if (detail::test_all(where, value, predicates...)) {
          assign(*key_ref{detail::entry_key(element)}, to_stored(where, value));
        }
      }
    }

    template <concepts::entry_range<V> R, typename... Ps>
      requires(concepts::predicate_for<Ps, detail::entry_value_t<R>> && ...)
    auto put_all_if(const R* source, const Ps&... predicates) -> void
    {
      if (source == nullptr) {
        detail::throw_null_argument("criteria_container::put_all_if", "source");
      }
      put_all_if(*source, predicates...);
    }

    template <concepts::entry_range<V> R,
      concepts::predicate_range<detail::entry_value_t<R>> P>
    auto put_all_if(const R& source, const P& predicates) -> void
    {
      constexpr auto where = "criteria_container::put_all_if";

      detail::require_non_null_keys(where, source);

      for (const auto& element : source) {
        const auto& value = detail::entry_value(element);
        if (detail::test_range(where, value, predicates)) {
          assign(*key_ref{detail::entry_key(element)}, to_stored(where, value));
        }
      }
    }

    template <concepts::entry_range<V> R,
      concepts::predicate_range<detail::entry_value_t<R>> P>
    auto put_all_if(const R& source, const P* predicates) -> void
    {
      if (predicates == nullptr) {
        detail::throw_null_argument(
          "criteria_container::put_all_if", "predicates");
      }
      put_all_if(source, *predicates);
    }

    // --- Conditional lookup ---

    /**
     * @brief Returns the value stored under @p key, narrowed to E, if every
     * predicate accepts it.
     *
     * Unlike get_optional(), a null value that passes the predicates is
     * returned as an engaged optional. Predicates are null-checked as
     * they are evaluated, so none are checked when the key is absent.
     *
     * @throws std::invalid_argument on a null key, or when a null predicate
     * is reached.
     * @throws type_mismatch if the stored value cannot be narrowed to E.
     */
    template <typename E = V, typename... Ps>
      requires concepts::narrowable_to<V, E>
            && (concepts::predicate_for<Ps, E> && ...)
    [[nodiscard]] auto get_if(key_ref key, const Ps&... predicates) const
      -> std::optional<E>
    {
      constexpr auto where = "criteria_container::get_if";

      const auto* stored = lookup(key.value(where));
      if (stored == nullptr) {
        return std::nullopt;
      }

      decltype(auto) value = narrow<E>(*stored);
      if (!detail::test_all(where, value, predicates...)) {
        return std::nullopt;
      }
      return std::optional<E>{
        std::in_place, std::forward<decltype(value)>(value)};
    }

    template <typename E = V, concepts::predicate_range<E> P>
      requires concepts::narrowable_to<V, E>
    [[nodiscard]] auto get_if(key_ref key, const P& predicates) const
      -> std::optional<E>
    {
      constexpr auto where = "criteria_container::get_if";

      const auto* stored = lookup(key.value(where));
      if (stored == nullptr) {
        return std::nullopt;
      }

      decltype(auto) value = narrow<E>(*stored);
      if (!detail::test_range(where, value, predicates)) {
        return std::nullopt;
      }
      return std::optional<E>{
        std::in_place, std::forward<decltype(value)>(value)};
    }

    template <typename E = V, concepts::predicate_range<E> P>
      requires concepts::narrowable_to<V, E>
    [[nodiscard]] auto get_if(key_ref key, const P* predicates) const
      -> std::optional<E>
    {
      if (predicates == nullptr) {
        detail::throw_null_argument("criteria_container::get_if", "predicates");
      }
      return get_if<E>(key, *predicates);
    }

    // --- Conditional callbacks ---

    /**
     * @brief Invokes @p action with the value stored under @p key, which
     * may itself be null.
     *
     * The key is not validated: a null key is simply not present.
     *
     * @return True if the action ran.
     * @throws std::invalid_argument if @p action is null.
     */
    template <concepts::action_for<V> A>
    auto if_present(key_ref key, A&& action) const -> bool
    {
      detail::require_callable("criteria_container::if_present", "action", action);

      if constexpr (std::invocable<A&, const V&>) {
        if (const auto* value = lookup_nullable(key)) {
          std::invoke(action, *value);
          return true;
        }
      }
      return false;
    }

    /**
     * @brief Invokes @p action with the value stored under @p key, narrowed
     * to E, if @p predicate accepts it.
     *
     * @return True if the action ran; false if the key is absent or the
     * predicate rejected the value.
     * @throws std::invalid_argument if @p key, @p action or @p predicate is
     * null.
     * @throws type_mismatch if the stored value cannot be narrowed to E.
     */
    template <typename E = V, typename A, typename P>
      requires concepts::narrowable_to<V, E> && concepts::action_for<A, E>
            && concepts::predicate_for<P, E>
    auto if_present(key_ref key, A&& action, const P& predicate) const -> bool
    {
      constexpr auto where = "criteria_container::if_present";

      auto name = key.value(where);
      detail::require_callable(where, "action", action);
      detail::require_callable(where, "predicate", predicate);

      const auto* stored = lookup(name);
      if (stored == nullptr) {
        return false;
      }

      decltype(auto) value = narrow<E>(*stored);
      if (!detail::test_all(where, value, predicate)) {
        return false;
      }

      if constexpr (std::invocable<A&, const E&>) {
        std::invoke(action, std::as_const(value));
      }
      return true;
    }

    /**
     * @brief Invokes @p action with each key and value, in insertion order.
     * @throws std::invalid_argument if @p action is null.
     */
    template <concepts::action_for<std::string, V> A>
    auto for_each(A&& action) const -> void
    {
      detail::require_callable("criteria_container::for_each", "action", action);

      if constexpr (std::invocable<A&, const std::string&, const V&>) {
        for (const auto& [key, value] : entries_) {
          std::invoke(action, key, value);
        }
      }
    }

    // --- Iteration (insertion order) ---

    [[nodiscard]] auto begin() const noexcept -> const_iterator
    {
      return entries_.begin();
    }

    [[nodiscard]] auto end() const noexcept -> const_iterator
    {
      return entries_.end();
    }

    [[nodiscard]] auto keys() const
    {
      return ranges::views::transform(entries_, &entry<V>::key);
    }

    [[nodiscard]] auto values() const
    {
      return ranges::views::transform(entries_, &entry<V>::value);
    }

    [[nodiscard]] auto entries() const { return ranges::views::all(entries_); }

    /**
     * @brief Map equality: the same keys mapped to equal values, in any
     * order.
     */
    [[nodiscard]] friend auto operator==(
      const criteria_container& lhs, const criteria_container& rhs) -> bool
      requires std::equality_comparable<V>
    {
      if (lhs.size() != rhs.size()) {
        return false;
      }

      for (const auto& [key, value] : lhs.entries_) {
        const auto* other = rhs.lookup(key);
        if (other == nullptr || !(*other == value)) {
          return false;
        }
      }
      return true;
    }

  private:
    [[nodiscard]] auto locate(std::string_view key) const
    {
      const auto& index = entries_.template get<detail::by_key>();
      return index.find(key, detail::string_hash{}, std::equal_to<>{});
    }

    [[nodiscard]] auto lookup(std::string_view key) const -> const V*
    {
      auto it = locate(key);
      return it != entries_.template get<detail::by_key>().end()
             ? std::addressof(it->value)
             : nullptr;
    }

    [[nodiscard]] auto lookup_nullable(key_ref key) const -> const V*
    {
      return key.is_null() ? nullptr : lookup(*key);
    }

    // Overwrites keep the original position in the sequenced index.
    auto assign(std::string_view key, V value) -> V
    {
      auto& index = entries_.template get<detail::by_key>();
      auto  it    = locate(key);

      if (it == index.end()) {
        entries_.push_back(value_type{std::string{key}, std::move(value)});
        return null_value<V>();
      }

      auto previous = it->value;
      index.replace(it, value_type{it->key, std::move(value)});
      return previous;
    }

    // A null candidate of another type is stored as the null marker of V.
    // It has no conversion when V has no null state.
    template <typename E>
    [[nodiscard]] static auto to_stored(std::string_view where, E&& value) -> V
    {
      if constexpr (is_nullable_v<E> && !std::same_as<std::remove_cvref_t<E>, V>) {
        if (is_null_value(value)) {
          if constexpr (is_nullable_v<V>) {
            return null_value<V>();
          } else {
            detail::throw_null_argument(where, "value");
          }
        }
      }
      return V(std::forward<E>(value));
    }

    // Rejects null keys, and null values V cannot hold, before anything is
    // applied.
    template <typename R>
    static auto require_storable(std::string_view where, const R& source) -> void
    {
      detail::require_non_null_keys(where, source);

      using source_value = detail::entry_value_t<R>;
      if constexpr (!is_nullable_v<V> && is_nullable_v<source_value>
                    && !std::same_as<source_value, V>) {
        for (const auto& element : source) {
          if (is_null_value(detail::entry_value(element))) {
            detail::throw_null_argument(where, "value");
          }
        }
      }
    }

    // Precondition: require_storable(where, source) passed.
    template <typename R>
    auto assign_all(std::string_view where, const R& source) -> void
    {
      for (const auto& element : source) {
        assign(*key_ref{detail::entry_key(element)},
          to_stored(where, detail::entry_value(element)));
      }
    }

    storage_type entries_;
  };

} // namespace criteria

#endif // CRITERIA_CONTAINER_CRITERIA_CONTAINER_HPP
