#include "btree/btree.hpp"
#include "PerfEvent.hpp"
#include <algorithm>
#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

void runTest(vector<i64> &keys, unsigned degree, PerfEvent &perf)
{
    if (getenv("SHUF"))
    {
        std::mt19937 g(42);
        std::shuffle(keys.begin(), keys.end(), g);
    }
    if (getenv("SORT"))
        sort(keys.begin(), keys.end());

    RecordTree *t = btree_create(degree);
    if (!t)
        throw std::invalid_argument("DEGREE must be at least " + to_string(RecordTree::minDegree));

    uint64_t count = keys.size();

    {
        PerfEventBlock peb(perf, count, {"insert"});
        for (uint64_t i = 0; i < count; ++i)
        {
            btree_insert(t, keys[i], reinterpret_cast<u8 *>(&i), sizeof(uint64_t));
        }
    }
    if (getenv("INFO"))
        t->printInfos();

    {
        PerfEventBlock peb(perf, count, {"lookup"});
        for (uint64_t i = 0; i < count; ++i)
        {
            u16 payloadLength;
            u8 *payload = btree_lookup(t, keys[i], payloadLength);
            if (!payload || payloadLength != sizeof(uint64_t) || *reinterpret_cast<uint64_t *>(payload) != i)
                throw std::logic_error("lookup returned a wrong payload for key " + to_string(keys[i]));
        }
    }
    btree_destroy(t);
}

int main()
{
    PerfEvent perf;
    unsigned degree = getenv("DEGREE") ? atoi(getenv("DEGREE")) : RecordTree::defaultDegree;
    if (getenv("INT"))
    {
        vector<i64> data;
        uint64_t n = atof(getenv("INT"));
        for (uint64_t i = 0; i < n; i++)
            data.push_back(i);
        runTest(data, degree, perf);
    }

    return 0;
}
