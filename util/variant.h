#ifndef ECMATH_UTIL_VARIANT_H_INCLUDED
#define ECMATH_UTIL_VARIANT_H_INCLUDED

#include <type_traits>
#include <utility>
#include <cassert>
#include <cstddef>
#include <new>
#include <stdexcept>
#include <string>

namespace ecmath { namespace util {

namespace detail {

template<int count, typename Candidate, typename... Ts>
struct get_index_helper;

template<int count, typename Candidate, typename T>
struct get_index_helper<count, Candidate, T> {
    static constexpr int value = std::is_same<Candidate, T>::value ? count : -1;
};

template<int count, typename Candidate, typename T, typename... Ts>
struct get_index_helper<count, Candidate, T, Ts...> {
    static constexpr int value = std::is_same<Candidate, T>::value ? count : get_index_helper<count+1,Candidate,Ts...>::value;
};

template<typename Candidate, typename... Ts>
constexpr int get_index() {
    static_assert(get_index_helper<0, Candidate, Ts...>::value != -1, "Trying to construct union with unknown type");
    return get_index_helper<0, Candidate, Ts...>::value;
}

template<typename... Ts>
struct max_size;

template<typename T>
struct max_size<T>
    : public std::integral_constant<size_t, sizeof(T)> {};

template<typename T, typename... Ts>
struct max_size<T, Ts...>
    : public std::integral_constant<size_t, (sizeof(T) > max_size<Ts...>::value ? sizeof(T) : max_size<Ts...>::value)> {};

template<typename... Ts>
struct max_align;

template<typename T>
struct max_align<T>
    : public std::integral_constant<size_t, alignof(T)> {};

template<typename T, typename... Ts>
struct max_align<T, Ts...>
    : public std::integral_constant<size_t, (alignof(T) > max_align<Ts...>::value ? alignof(T) : max_align<Ts...>::value)> {};

template<typename... Ts>
struct invoke_helper;

template<typename T>
struct invoke_helper<T> {
    template<typename F>
    static void invoke(void* storage, int type, F& f) {
        assert(type == 0);
        (void)type;
        f(*reinterpret_cast<T*>(storage));
    }
    template<typename F>
    static void invoke(const void* storage, int type, F& f) {
        assert(type == 0);
        (void)type;
        f(*reinterpret_cast<const T*>(storage));
    }
};

template<typename T, typename... Ts>
struct invoke_helper<T, Ts...> {
    template<typename F>
    static void invoke(void* storage, int type, F& f) {
        if (!type) {
            f(*reinterpret_cast<T*>(storage));
        } else {
            invoke_helper<Ts...>::invoke(storage, type - 1, f);
        }
    }
    template<typename F>
    static void invoke(const void* storage, int type, F& f) {
        if (!type) {
            f(*reinterpret_cast<const T*>(storage));
        } else {
            invoke_helper<Ts...>::invoke(storage, type - 1, f);
        }
    }
};

} // namespace detail

// Tagged union of Ts. Always holds exactly one alternative except after being moved from.
template<typename... Ts>
class variant {
public:
    template<typename U, typename = typename std::enable_if<!std::is_same<typename std::decay<U>::type, variant>::value>::type>
    variant(U&& the_u) : type(detail::get_index<typename std::decay<U>::type, Ts...>()) {
        assert(type >= 0);
        new (&storage) typename std::decay<U>::type(std::forward<U>(the_u));
    }

    ~variant() {
        destroy();
    }

    variant(const variant& other) : type(invalid_type) {
        copy(other);
    }

    variant(variant&& other) : type(invalid_type) {
        move(other);
    }

    variant& operator=(const variant& other) {
        if (this != &other) {
            destroy();
            copy(other);
        }
        return *this;
    }

    variant& operator=(variant&& other) {
        if (this != &other) {
            destroy();
            move(other);
        }
        return *this;
    }

    template<typename U>
    bool is() const {
        return type == detail::get_index<U, Ts...>();
    }

    template<typename F>
    void invoke(F f) {
        check_valid();
        detail::invoke_helper<Ts...>::invoke(static_cast<void*>(&storage), type, f);
    }

    template<typename F>
    void invoke(F f) const {
        check_valid();
        detail::invoke_helper<Ts...>::invoke(static_cast<const void*>(&storage), type, f);
    }

    template<typename U>
    U& get() {
        check_type(detail::get_index<U, Ts...>());
        return *reinterpret_cast<U*>(&storage);
    }

    template<typename U>
    const U& get() const {
        check_type(detail::get_index<U, Ts...>());
        return *reinterpret_cast<const U*>(&storage);
    }

private:
    static constexpr size_t size      = detail::max_size<Ts...>::value;
    static constexpr size_t alignment = detail::max_align<Ts...>::value;
    static constexpr int    invalid_type = -1;
    using                   storage_t = typename std::aligned_storage<size, alignment>::type;
    int                     type;
    storage_t               storage;

    void check_valid() const {
        if (type == invalid_type) {
            throw std::logic_error("Access to moved-from variant");
        }
    }

    void check_type(int wanted_type) const {
        if (type != wanted_type) {
            throw std::logic_error("Invalid cast to type " + std::to_string(wanted_type) + " from " + std::to_string(type));
        }
    }

    struct destroy_helper {
        template<typename T>
        void operator()(T& t) {
            t.~T();
        }
    };

    void destroy() {
        if (type != invalid_type) {
            destroy_helper helper;
            detail::invoke_helper<Ts...>::invoke(static_cast<void*>(&storage), type, helper);
            type = invalid_type;
        }
    }

    struct move_helper {
        explicit move_helper(void* to) : to(to) {}
        template<typename U>
        void operator()(U& u) {
            new (to) U(std::move(u));
        }
        void* to;
    };

    struct copy_helper {
        explicit copy_helper(void* to) : to(to) {}
        template<typename U>
        void operator()(const U& u) {
            new (to) U(u);
        }
        void* to;
    };

    void copy(const variant& other) {
        assert(this != &other);
        assert(type == invalid_type);
        if (other.type != invalid_type) {
            copy_helper helper(&storage);
            detail::invoke_helper<Ts...>::invoke(static_cast<const void*>(&other.storage), other.type, helper);
        }
        type = other.type; // only assign type after copy is sucessful
    }

    void move(variant& other) {
        assert(this != &other);
        assert(type == invalid_type);
        if (other.type != invalid_type) {
            move_helper helper(&storage);
            detail::invoke_helper<Ts...>::invoke(static_cast<void*>(&other.storage), other.type, helper);
            type = other.type;
            other.destroy();
        }
    }
};

} } // namespace ecmath::util

#endif
