/**
 * @file btree.cpp
 * @brief byte record interface over the B-tree index
 * @date 2026-10-19
 */

#include "btree.hpp"
#include <cstring>

RecordTree *btree_create(unsigned degree)
{
   if (degree < RecordTree::minDegree)
      return nullptr;
   return new RecordTree(degree);
}

void btree_destroy(RecordTree *tree)
{
   delete tree;
}

bool btree_insert(RecordTree *tree, i64 key, u8 *value, u16 valueLength)
{
   if (!tree || (!value && valueLength > 0))
      return false;
   std::vector<u8> payload(valueLength);
   if (valueLength > 0)
      memcpy(payload.data(), value, valueLength);
   return tree->insert(key, std::move(payload));
}

u8 *btree_lookup(RecordTree *tree, i64 key, u16 &payloadLengthOut)
{
   static u8 EmptyPayload;
   payloadLengthOut = 0;
   if (!tree)
      return nullptr;
   std::vector<u8> *payload = tree->lookup(key);
   if (!payload)
      return nullptr;
   payloadLengthOut = payload->size();
   if (payload->empty())
      return &EmptyPayload;
   return payload->data();
}

void btree_walk(RecordTree *tree,
                const std::function<bool(i64, const u8 *, unsigned int)> &found_callback)
{
   if (!tree)
   {
      std::cout << "tree is null" << std::endl;
      return;
   }
   tree->forEach([&](const i64 &key, const std::vector<u8> &payload) {
      return found_callback(key, payload.data(), payload.size());
   });
}
