/**
 * @file MemberMap.hpp
 * @brief Insertion ordered storage for object members
 *
 * Same shape as nlohmann::ordered_map (a vector of key/value pairs searched
 * linearly), but the key is not const. Members therefore relocate by move
 * when the vector grows or an erase shifts them, so exclusive child handles
 * keep their ownership tag.
 */

#ifndef JPATCH_MEMBERMAP_HPP
#define JPATCH_MEMBERMAP_HPP

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace jpatch {

template <class Key, class T>
class MemberMap : public std::vector<std::pair<Key, T>> {
public:
    using key_type = Key;
    using mapped_type = T;
    using Container = std::vector<std::pair<Key, T>>;
    using iterator = typename Container::iterator;
    using const_iterator = typename Container::const_iterator;
    using size_type = typename Container::size_type;
    using value_type = typename Container::value_type;

    MemberMap() = default;
    MemberMap(std::initializer_list<value_type> init) : Container(init) {}

    iterator find(const Key& key) {
        for (auto it = this->begin(); it != this->end(); ++it) {
            if (it->first == key) return it;
        }
        return this->end();
    }

    const_iterator find(const Key& key) const {
        for (auto it = this->begin(); it != this->end(); ++it) {
            if (it->first == key) return it;
        }
        return this->end();
    }

    bool contains(const Key& key) const {
        return find(key) != this->end();
    }

    T& at(const Key& key) {
        auto it = find(key);
        if (it == this->end()) {
            throw std::out_of_range("key not found");
        }
        return it->second;
    }

    const T& at(const Key& key) const {
        auto it = find(key);
        if (it == this->end()) {
            throw std::out_of_range("key not found");
        }
        return it->second;
    }

    // Appends a default value for a new key
    T& operator[](const Key& key) {
        auto it = find(key);
        if (it != this->end()) {
            return it->second;
        }
        this->emplace_back(key, T());
        return this->back().second;
    }

    /**
     * @brief Append a member unless the key is already present
     * @return Iterator to the member with @p key, and whether it was inserted
     */
    std::pair<iterator, bool> emplace(const Key& key, T&& value) {
        auto it = find(key);
        if (it != this->end()) {
            return {it, false};
        }
        this->emplace_back(key, std::move(value));
        return {std::prev(this->end()), true};
    }

    using Container::erase;

    size_type erase(const Key& key) {
        auto it = find(key);
        if (it == this->end()) {
            return 0;
        }
        Container::erase(it);
        return 1;
    }
};

} // namespace jpatch

#endif // JPATCH_MEMBERMAP_HPP
