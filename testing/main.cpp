#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

/**
 * List of Tests:
 *
 * 1) construction:
 *      degree below minimum
 *      empty tree
 *
 * 2) insert:
 *      normal insert
 *      duplicate replaces
 *      root stays a leaf until full
 *      root split at the minimum degree
 *      record sequence with inner and root splits
 *
 * 3) split
 *      leaf child
 *      inner child
 *      sibling in the middle of the parent
 *
 * 4) lookup
 *      simple
 *      non existent
 *      multiple same query
 *
 * 5) invariants
 *      validate after every insert
 *      height grows by at most one
 *      walk order independent of insert order
 *      std::map as reference
 *
 * 6) byte record interface
 */
