/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <algorithm>
#include <cstddef>

namespace nmk {

/**
 * Removes all elements matching the predicate from the container.
 * @param container The container to remove elements from.
 * @param pred The predicate which returns true for the elements to remove.
 * @return The number of removed elements.
 */
template<typename Container, typename Pred>
size_t stl_remove_if(Container& container, Pred pred) {
    auto old_size = container.size();
    container.erase(std::remove_if(container.begin(), container.end(), pred), container.end());
    return old_size - container.size();
}

/**
 * @return True if the container contains the given value.
 */
template<typename Container, typename Value>
bool stl_contains(const Container& container, const Value& value) {
    return std::find(container.begin(), container.end(), value) != container.end();
}

}  // namespace nmk
