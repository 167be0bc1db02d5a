#pragma once


/*
    ------------------------------------------
    Stanza::value - Canonical structured value
    ------------------------------------------
    `Stanza::value` is the language-agnostic document every conversion
    produces. It holds exactly one of:
        - null
        - boolean
        - number (as double)
        - string
        - array (ordered)
        - object (keys kept in lexicographic order)

    The model is JSON-isomorphic on purpose: an emitter can write it out
    without knowing anything about the expression tree it came from

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware; strings, arrays and objects are allocated
      from the `std::pmr::memory_resource` stored in the value
    - Copying a value deep-copies the whole tree into the source's resource
    - Moving a value steals the resource and the storage

    ---------------
    Building Values
    ---------------
    - `operator[](std::string_view)` turns the value into an object (if it is
      not one already) and inserts `null` for missing keys
    - `operator[](size_t)` turns the value into an array and grows it with
      `null` elements as needed
    - `as_array()` / `as_object()` (non-const) convert in place

    Converters build objects by assigning keys one after another:

        Stanza::value v;
        v["kind"] = "Paren";
        v["attrs"].as_array();
        v["expr"] = std::move(inner);

    --------
    Equality
    --------
    - Structural: same kind and same contents. The memory resource is not
      compared, so two conversions of the same tree always compare equal

    -------------
    Thread-Safety
    -------------
    - Distinct `value` instances may be used from distinct threads
    - Shared instances need external synchronization
*/

/// @defgroup Stanza Stanza expression converter
/// @brief Core types and functions for Stanza

/// @defgroup StanzaValue Canonical Value
/// @ingroup Stanza

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <memory_resource>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <utility>
#include "stanza/config.hpp"

namespace Stanza {
    /// @brief Enumerates the kinds of data a Stanza::value can hold
    enum class kind : uint8_t {
        null,    ///< Absent optional field
        boolean, ///< `true` or `false`
        number,  ///< Numeric value (stored as `double`)
        string,  ///< UTF-8 text
        array,   ///< Ordered sequence of values
        object,  ///< Key to value mapping, keys sorted
    };


    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    template<class Key, class T, class Compare = std::less<>>
    using pmr_map = std::pmr::map<Key, T, Compare>;

    /// @ingroup StanzaValue
    /// @brief String type used by Stanza::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup StanzaValue
    /// @brief Ordered array of values
    using array = pmr_vector<value>;

    /// @ingroup StanzaValue
    /// @brief Object with lexicographically ordered keys
    using object = pmr_map<string, value>;

    /// @ingroup StanzaValue
    /// @brief Variant storage backing Stanza::value
    using storage_t = std::variant<
        std::monostate,
        bool,
        double,
        string,
        array,
        object
    >;


    /// @ingroup StanzaValue
    /// @brief Canonical structured value produced by the node converter
    ///
    /// @details
    /// All nested allocations use the `std::pmr::memory_resource` given at
    /// construction. The container-like operations (`as_array`, `as_object`,
    /// `operator[]`) allocate from that resource
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @brief Constructs a null value
        /// @param res Resource used for every nested allocation
        STANZA_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a null value (explicit `nullptr` spelling)
        STANZA_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a boolean value
        STANZA_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a number from a double
        STANZA_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a number from an integral type
        ///
        /// @details
        /// Used for tuple member indices and byte literals, both of which
        /// are exactly representable as `double`
        template<std::integral I>
        explicit value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<double>(i) } {}

        /// @brief Constructs a string from a null-terminated UTF-8 string
        STANZA_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a string by copying @p sv into the resource
        STANZA_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a string from an existing Stanza::string
        STANZA_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs an array value (moved in)
        STANZA_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs an object value (moved in)
        STANZA_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Deep copy into the resource of @p other
        STANZA_API value(const value& other);

        /// @brief Steals storage and resource from @p other
        STANZA_API value(value&& other) noexcept;

        STANZA_API value& operator=(const value& other);
        STANZA_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @brief Returns the kind currently stored
        STANZA_API [[nodiscard]] kind type() const noexcept;

        STANZA_API [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null;    }
        STANZA_API [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::boolean; }
        STANZA_API [[nodiscard]] bool is_number() const noexcept { return type() == kind::number;  }
        STANZA_API [[nodiscard]] bool is_string() const noexcept { return type() == kind::string;  }
        STANZA_API [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array;   }
        STANZA_API [[nodiscard]] bool is_object() const noexcept { return type() == kind::object;  }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        /// @brief Stored boolean
        /// @throws std::bad_variant_access if the value is not a boolean
        STANZA_API [[nodiscard]] bool&       as_bool();
        STANZA_API [[nodiscard]] const bool& as_bool() const;

        /// @brief Stored number
        /// @throws std::bad_variant_access if the value is not a number
        STANZA_API [[nodiscard]] double&       as_number();
        STANZA_API [[nodiscard]] const double& as_number() const;

        /// @brief Stored string
        /// @throws std::bad_variant_access if the value is not a string
        STANZA_API [[nodiscard]] string&       as_string();
        STANZA_API [[nodiscard]] const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        /// @brief Returns the array, replacing any other content with an
        ///        empty array first
        STANZA_API array&       as_array();

        /// @brief Returns the stored array
        /// @throws std::bad_variant_access if the value is not an array
        STANZA_API [[nodiscard]] const array& as_array() const;

        /// @brief Returns the object, replacing any other content with an
        ///        empty object first
        STANZA_API object&       as_object();

        /// @brief Returns the stored object
        /// @throws std::bad_variant_access if the value is not an object
        STANZA_API [[nodiscard]] const object& as_object() const;

        /// @brief Number of elements (array) or members (object), 0 otherwise
        STANZA_API [[nodiscard]] size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @brief Accesses or creates an array element, growing with nulls
        STANZA_API value& operator[](size_t idx);

        /// @brief Read-only element access; out of range or non-array
        ///        yields a shared null value
        STANZA_API const value& operator[](size_t idx) const;

        /// @brief Accesses or creates an object member (inserted as null)
        STANZA_API value& operator[](std::string_view key);

        /// @brief Read-only member access; missing key or non-object yields
        ///        a shared null value
        STANZA_API const value& operator[](std::string_view key) const;

        /// @brief Finds a member by key
        /// @return Pointer to the member, or nullptr when absent or when the
        ///         value is not an object
        STANZA_API const value* find(std::string_view key) const;

        /// @brief Returns the member associated with @p key
        /// @throws std::out_of_range If the key does not exist or the value is not an object
        STANZA_API const value& at(std::string_view key) const;

        /// @brief Structural equality; the memory resource does not take part
        STANZA_API friend bool operator==(const value& lhs, const value& rhs);

        /// @brief Memory resource used by this value and its descendants
        [[nodiscard]] STANZA_API std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        /// @brief Raw variant storage
        [[nodiscard]] STANZA_API const storage_t& storage() const noexcept { return m_Storage; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace Stanza
