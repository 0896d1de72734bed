/**
 * @file btree.hpp
 * @brief in-memory B-tree index with proactive node splitting
 * @date 2026-10-19
 */

#pragma once

#include <iostream>
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i64 = int64_t;

struct ConfigurationError : public std::invalid_argument
{
    explicit ConfigurationError(const std::string &what)
        : std::invalid_argument(what) {}
};

template <typename Key, typename Value>
struct BTreeNode
{
    std::vector<Key> keys;
    std::vector<Value> values;
    std::vector<BTreeNode *> children; // empty on leaves, keys.size() + 1 entries otherwise

    explicit BTreeNode(unsigned degree)
    {
        keys.reserve(2 * degree - 1);
        values.reserve(2 * degree - 1);
    }

    BTreeNode(const BTreeNode &) = delete;
    BTreeNode &operator=(const BTreeNode &) = delete;

    inline bool isLeaf() const { return children.empty(); }
    inline bool isInner() const { return !isLeaf(); }
    inline unsigned count() const { return keys.size(); }

    static BTreeNode *makeLeaf(unsigned degree) { return new BTreeNode(degree); }

    static BTreeNode *makeInner(BTreeNode *child, unsigned degree)
    {
        BTreeNode *node = new BTreeNode(degree);
        node->children.reserve(2 * degree);
        node->children.push_back(child);
        return node;
    }

    // first slot whose key is >= key, count() if there is none
    unsigned lowerBound(const Key &key) const
    {
        unsigned lower = 0;
        unsigned upper = count();
        while (lower < upper)
        {
            unsigned mid = lower + (upper - lower) / 2;
            if (keys[mid] < key)
                lower = mid + 1;
            else
                upper = mid;
        }
        return lower;
    }

    inline bool matches(unsigned pos, const Key &key) const
    {
        return pos < count() && !(key < keys[pos]);
    }

    bool isSorted() const
    {
        for (unsigned i = 1; i < count(); ++i)
        {
            if (!(keys[i - 1] < keys[i]))
            {
                std::cout << "keys out of order at index " << i << " of " << count() << std::endl;
                return false;
            }
        }
        return true;
    }

    void insertAt(unsigned pos, const Key &key, Value &&value)
    {
        assert(pos <= count());
        keys.insert(keys.begin() + pos, key);
        values.insert(values.begin() + pos, std::move(value));
    }

    /**
     * Splits the full child at children[index]. The child keeps its lower
     * degree-1 records, the median moves up into this node at index and the
     * upper degree-1 records (and degree children) go to a new right sibling.
     */
    void splitChild(unsigned index, unsigned degree)
    {
        assert(index < children.size());
        assert(count() < 2 * degree - 1);
        BTreeNode *left = children[index];
        assert(left->count() == 2 * degree - 1);

        BTreeNode *right = new BTreeNode(degree);
        if (left->isInner())
            right->children.reserve(2 * degree);

        right->keys.assign(std::make_move_iterator(left->keys.begin() + degree),
                           std::make_move_iterator(left->keys.end()));
        right->values.assign(std::make_move_iterator(left->values.begin() + degree),
                             std::make_move_iterator(left->values.end()));
        if (left->isInner())
        {
            right->children.assign(left->children.begin() + degree, left->children.end());
            left->children.erase(left->children.begin() + degree, left->children.end());
        }

        keys.insert(keys.begin() + index, std::move(left->keys[degree - 1]));
        values.insert(values.begin() + index, std::move(left->values[degree - 1]));
        children.insert(children.begin() + index + 1, right);

        left->keys.erase(left->keys.begin() + (degree - 1), left->keys.end());
        left->values.erase(left->values.begin() + (degree - 1), left->values.end());
    }

    void destroy()
    {
        for (BTreeNode *child : children)
            child->destroy();
        delete this;
    }

    void print(unsigned depth = 0) const
    {
        for (unsigned i = 0; i < depth; ++i)
            std::cout << "  ";
        std::cout << (isLeaf() ? "L" : "I") << " [";
        for (unsigned i = 0; i < count(); ++i)
        {
            std::cout << keys[i];
            if (i + 1 < count())
                std::cout << ", ";
        }
        std::cout << "]" << std::endl;
        for (BTreeNode *child : children)
            child->print(depth + 1);
    }
};

template <typename Key, typename Value>
struct BTree
{
    using Node = BTreeNode<Key, Value>;

    static constexpr unsigned minDegree = 2;
    static constexpr unsigned defaultDegree = 16;

    Node *root;
    unsigned degree;
    u64 recordCount = 0;

    explicit BTree(unsigned degree = defaultDegree)
        : root(nullptr), degree(degree)
    {
        if (degree < minDegree)
            throw ConfigurationError("btree degree must be at least " + std::to_string(minDegree) +
                                     ", got " + std::to_string(degree));
        root = Node::makeLeaf(degree);
    }

    BTree(const BTree &) = delete;
    BTree &operator=(const BTree &) = delete;

    ~BTree()
    {
        root->destroy();
    }

    inline bool isFull(const Node *node) const { return node->count() == 2 * degree - 1; }
    inline u64 size() const { return recordCount; }
    inline bool empty() const { return recordCount == 0; }

    Value *lookup(const Key &key)
    {
        Node *node = root;
        while (true)
        {
            unsigned pos = node->lowerBound(key);
            if (node->matches(pos, key))
                return &node->values[pos];
            if (node->isLeaf())
                return nullptr;
            node = node->children[pos];
        }
    }

    const Value *lookup(const Key &key) const
    {
        return const_cast<BTree *>(this)->lookup(key);
    }

    bool lookup(const Key &key, Value &result) const
    {
        const Value *value = lookup(key);
        if (!value)
            return false;
        result = *value;
        return true;
    }

    bool contains(const Key &key) const { return lookup(key) != nullptr; }

    // replaces exising record if any, returns true iff the key was not present
    bool insert(const Key &key, Value value)
    {
        if (Value *existing = lookup(key))
        {
            *existing = std::move(value);
            return false;
        }

        if (isFull(root))
        {
            Node *newRoot = Node::makeInner(root, degree);
            newRoot->splitChild(0, degree);
            root = newRoot;
        }

        Node *node = root;
        while (node->isInner())
        {
            unsigned pos = node->lowerBound(key);
            if (isFull(node->children[pos]))
            {
                node->splitChild(pos, degree);
                if (node->keys[pos] < key)
                    pos++;
            }
            node = node->children[pos];
        }
        node->insertAt(node->lowerBound(key), key, std::move(value));
        assert(node->isSorted());
        recordCount++;
        return true;
    }

    unsigned height() const
    {
        unsigned levels = 1;
        for (const Node *node = root; node->isInner(); node = node->children.front())
            levels++;
        return levels;
    }

    // in-order walk, stops as soon as the callback returns false
    bool forEach(const std::function<bool(const Key &, const Value &)> &callback) const
    {
        return walk(root, callback);
    }

    bool validate() const
    {
        int leafDepth = -1;
        return validateNode(root, nullptr, nullptr, 0, leafDepth);
    }

    void print() const { root->print(); }

    void printInfos() const
    {
        u64 nodes = 0, innerNodes = 0, keys = 0;
        countNodes(root, nodes, innerNodes, keys);
        double capacity = static_cast<double>(nodes) * (2 * degree - 1);
        std::cerr << "nodes:" << nodes << " innerNodes:" << innerNodes << " height:" << height()
                  << " rootCnt:" << root->count() << " degree:" << degree
                  << " fillfactor:" << (keys / capacity) << std::endl;
    }

private:
    static bool walk(const Node *node, const std::function<bool(const Key &, const Value &)> &callback)
    {
        for (unsigned i = 0; i < node->count(); ++i)
        {
            if (node->isInner() && !walk(node->children[i], callback))
                return false;
            if (!callback(node->keys[i], node->values[i]))
                return false;
        }
        if (node->isInner())
            return walk(node->children.back(), callback);
        return true;
    }

    static void countNodes(const Node *node, u64 &nodes, u64 &innerNodes, u64 &keys)
    {
        nodes++;
        keys += node->count();
        if (node->isLeaf())
            return;
        innerNodes++;
        for (const Node *child : node->children)
            countNodes(child, nodes, innerNodes, keys);
    }

    // lower and upper are exclusive bounds inherited from the ancestors, nullptr if open
    bool validateNode(const Node *node, const Key *lower, const Key *upper, int depth, int &leafDepth) const
    {
        if (node->values.size() != node->keys.size())
        {
            std::cout << "node at depth " << depth << " has " << node->keys.size() << " keys but "
                      << node->values.size() << " values" << std::endl;
            return false;
        }
        if (node->count() > 2 * degree - 1 || (node != root && node->count() < degree - 1))
        {
            std::cout << "node at depth " << depth << " holds " << node->count() << " keys, allowed ["
                      << degree - 1 << ", " << 2 * degree - 1 << "]" << std::endl;
            return false;
        }
        if (!node->isSorted())
            return false;
        if (node->count() > 0)
        {
            if ((lower && !(*lower < node->keys.front())) || (upper && !(node->keys.back() < *upper)))
            {
                std::cout << "node at depth " << depth << " has keys outside its separator range" << std::endl;
                return false;
            }
        }
        if (node->isLeaf())
        {
            if (leafDepth == -1)
                leafDepth = depth;
            if (leafDepth != depth)
            {
                std::cout << "leaf at depth " << depth << ", expected " << leafDepth << std::endl;
                return false;
            }
            return true;
        }
        if (node->children.size() != node->keys.size() + 1)
        {
            std::cout << "inner node at depth " << depth << " has " << node->children.size()
                      << " children for " << node->count() << " keys" << std::endl;
            return false;
        }
        for (unsigned i = 0; i <= node->count(); ++i)
        {
            const Key *childLower = (i == 0) ? lower : &node->keys[i - 1];
            const Key *childUpper = (i == node->count()) ? upper : &node->keys[i];
            if (!validateNode(node->children[i], childLower, childUpper, depth + 1, leafDepth))
                return false;
        }
        return true;
    }
};

using RecordTree = BTree<i64, std::vector<u8>>;

// create a new tree and return a pointer to it, nullptr if degree is below RecordTree::minDegree
RecordTree *btree_create(unsigned degree);

// destroy a tree created by btree_create
void btree_destroy(RecordTree *tree);

// replaces exising record if any, returns true iff the key was not present
bool btree_insert(RecordTree *tree, i64 key, u8 *value, u16 valueLength);

// returns a pointer to the associated value if present, nullptr otherwise.
// the pointer stays valid until the next insert.
u8 *btree_lookup(RecordTree *tree, i64 key, u16 &payloadLengthOut);

// invokes the callback for all records in key order with key, value pointer and
// value length. iteration stops if there are no more records or the callback
// returns false.
void btree_walk(RecordTree *tree,
                const std::function<bool(i64, const u8 *, unsigned int)> &found_callback);
