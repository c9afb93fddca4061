
#pragma once

#include "_node-data.hpp"
#include "_base-node-ops.hpp"
#include "_node-ops.hpp"
#include "_iterator.hpp"
#include "_base-trie.hpp"
#include "_transient-trie.hpp"
