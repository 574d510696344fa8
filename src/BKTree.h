/*
 * BKTree
 *
 * Copyright (c) 2016 "0of" Magnus
 * Licensed under the MIT license.
 * https://github.com/0of/bktree-leveldb/blob/master/LICENSE
 */

#ifndef BKTREE_H
#define BKTREE_H

#include <map>
#include <queue>
#include <vector>
#include <memory>
#include <limits>
#include <utility>
#include <iterator>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <initializer_list>

//
// DistancePolicy is a callable stored by value:
//  std::uint32_t operator()(const Key& a, const Key& b) const
//
// it must behave as a metric (dist(a, a) == 0, symmetric, triangle inequality),
// which is assumed but never checked. A policy breaking it makes find() miss matches
//
template<typename Key, typename DistancePolicy>
class BKTree {

  //
  // each node holds one key and its children keyed by the distance between
  // the node key and the child key, measured when the child was attached
  //
  // [key] -> { [distance] -> [child node] ... }
  //
  // children are kept sorted by distance so a query only walks the
  // distances range allowed by the triangle inequality
  //

public:
  using KeyType = Key;
  using Match = std::pair<Key, std::uint32_t>;

private:
  using SelfType = BKTree<Key, DistancePolicy>;

  struct Node {
    Key key;
    std::map<std::uint32_t, std::unique_ptr<Node>> children;

    explicit Node(Key&& k)
      : key{ std::move(k) }
    {}
  };

private:
  std::unique_ptr<Node> _root;
  DistancePolicy _distance;
  std::size_t _size;

public:
  class ConstIterator : public std::iterator<std::input_iterator_tag, Key, std::ptrdiff_t, const Key*, const Key&> {
  private:
    std::vector<const Node *> _pending;

  public:
    ConstIterator() = default;

    explicit ConstIterator(const Node *root) {
      if (root)
        _pending.push_back(root);
    }

    const Key& operator *() const { return _pending.back()->key; }
    const Key* operator ->() const { return &_pending.back()->key; }

    ConstIterator& operator ++() {
      auto node = _pending.back();
      _pending.pop_back();

      for (const auto& child : node->children) {
        _pending.push_back(child.second.get());
      }
      return *this;
    }

    ConstIterator operator ++(int) {
      auto prev = *this;
      ++*this;
      return prev;
    }

    bool operator == (const ConstIterator& i) const { return _pending == i._pending; }
    bool operator != (const ConstIterator& i) const { return _pending != i._pending; }
  };

public:
  explicit BKTree(DistancePolicy distance = DistancePolicy{})
    : _root{}
    , _distance{ std::move(distance) }
    , _size{ 0 }
  {}

  BKTree(const SelfType&) = delete;
  SelfType& operator = (const SelfType&) = delete;

  BKTree(SelfType&& tree)
    : _root{ std::move(tree._root) }
    , _distance{ std::move(tree._distance) }
    , _size{ tree._size }
  {
    tree._size = 0;
  }

  SelfType& operator = (SelfType&& tree) {
    if (this != &tree) {
      ReleaseNodes(std::move(_root));

      _root = std::move(tree._root);
      _distance = std::move(tree._distance);
      _size = tree._size;
      tree._size = 0;
    }
    return *this;
  }

  ~BKTree() {
    ReleaseNodes(std::move(_root));
  }

public:
  // returns false if an equal key (distance 0) is already stored
  bool insert(Key key) {
    // if has no root key directly place the first key as root key
    if (!_root) {
      _root = std::make_unique<Node>(std::move(key));
      ++_size;
      return true;
    }

    auto current = _root.get();

    while (true) {
      auto d = static_cast<std::uint32_t>(_distance(current->key, key));

      if (0 == d) {
        // duplicated
        return false;
      }

      auto found = current->children.find(d);
      if (found == current->children.end()) {
        current->children.emplace(d, std::make_unique<Node>(std::move(key)));
        ++_size;
        return true;
      }

      // continue to search storage point
      current = found->second.get();
    }
  }

  template<typename InputIt>
  void insert(InputIt first, InputIt last) {
    for (; first != last; ++first) {
      insert(*first);
    }
  }

  template<typename Container>
  void insertAll(const Container& keys) {
    insert(std::begin(keys), std::end(keys));
  }

  void insertAll(std::initializer_list<Key> keys) {
    insert(keys.begin(), keys.end());
  }

  // all the stored keys within `threshold` of `key` paired with their distances, in no particular order
  template<typename ResultContainer = std::vector<Match>>
  ResultContainer find(const Key& key, std::uint32_t threshold) const {
    return find<ResultContainer>(key, threshold, std::numeric_limits<std::size_t>::max());
  }

  // stops once `limit` matches are collected
  template<typename ResultContainer = std::vector<Match>>
  ResultContainer find(const Key& key, std::uint32_t threshold, std::size_t limit) const {
    ResultContainer matches;

    if (!_root || 0 == limit)
      return matches;

    std::queue<const Node *> pendingNodes;
    pendingNodes.push(_root.get());

    while (!pendingNodes.empty()) {
      auto current = pendingNodes.front();
      pendingNodes.pop();

      auto d = static_cast<std::uint32_t>(_distance(current->key, key));

      if (d <= threshold) {
        matches.insert(matches.end(), Match{ current->key, d });
        if (matches.size() >= limit)
          break;
      }

      appendChildren(*current, d, threshold, pendingNodes);
    }

    return matches;
  }

  std::size_t size() const { return _size; }
  bool empty() const { return 0 == _size; }

  // visits every stored key once, in no particular order
  ConstIterator begin() const { return ConstIterator{ _root.get() }; }
  ConstIterator end() const { return ConstIterator{}; }

  const DistancePolicy& distancePolicy() const { return _distance; }

private:
  static void appendChildren(const Node& node, std::uint32_t d, std::uint32_t threshold, std::queue<const Node *>& pendingNodes) {
    if (node.children.empty())
      return;

    // a child at distance c can only lead to matches when |c - d| <= threshold
    auto lower = d < threshold ? 0 : d - threshold;
    auto upper = std::numeric_limits<std::uint32_t>::max() - d < threshold ? std::numeric_limits<std::uint32_t>::max() : d + threshold;

    auto lowerBound = node.children.lower_bound(lower);
    auto upperBound = node.children.upper_bound(upper);

    for (; lowerBound != upperBound; ++lowerBound) {
      pendingNodes.push(lowerBound->second.get());
    }
  }

  // tree depth is up to the insertion order, tear it down without recursion
  static void ReleaseNodes(std::unique_ptr<Node> root) {
    std::vector<std::unique_ptr<Node>> pendingNodes;
    if (root)
      pendingNodes.push_back(std::move(root));

    while (!pendingNodes.empty()) {
      auto node = std::move(pendingNodes.back());
      pendingNodes.pop_back();

      for (auto& child : node->children) {
        pendingNodes.push_back(std::move(child.second));
      }
    }
  }
};

template<typename Key, typename DistancePolicy>
BKTree<Key, std::decay_t<DistancePolicy>> MakeBKTree(DistancePolicy&& distance) {
  return BKTree<Key, std::decay_t<DistancePolicy>>{ std::forward<DistancePolicy>(distance) };
}

#endif // BKTREE_H
