#include "hintc/hintc.hpp"
#include <chrono>
#include <iostream>
#include <vector>
#include <cstdlib>

using Clock = std::chrono::steady_clock;

struct RunResult { double ns_per_check; size_t accepted; };

static hintc::node_ptr make_value(const std::string& shape, size_t n){
    auto v = hintc::node_vec();
    for(size_t i=0;i<n;++i){
        if(shape=="flat") v << hintc::n_i64((int64_t)i);
        else {
            auto row = hintc::node_vec();
            row << hintc::n_i64((int64_t)i) << hintc::n_i64((int64_t)i + 1);
            v << row;
        }
    }
    return v;
}

static RunResult bench_case(hintc::CheckerCache& cache, const char* spec, const hintc::node_ptr& value,
                            hintc::Strategy strategy, int iters){
    hintc::CheckConf conf;
    conf.strategy = strategy;
    auto checker = hintc::compile(cache, hintc::parse(spec), nullptr, conf);
    size_t accepted = 0;
    auto t0 = Clock::now();
    for(int i=0;i<iters;++i) if(checker->check(value)) ++accepted;
    auto t1 = Clock::now();
    double ns = std::chrono::duration<double, std::nano>(t1 - t0).count() / iters;
    return {ns, accepted};
}

int main(int argc, char** argv){
    int iters = argc > 1 ? std::atoi(argv[1]) : 2000;
    if(iters <= 0) iters = 2000;

    struct Case { const char* name; const char* spec; const char* shape; };
    std::vector<Case> cases = {
        {"vector_of_int", "(vector-of int)", "flat"},
        {"union_elems", "(vector-of (union string float int))", "flat"},
        {"pairs", "(vector-of (tuple int int))", "pairs"},
        {"nested", "(vector-of (vector-of number))", "pairs"},
    };

    hintc::CheckerCache cache;
    std::cout << "name,size,strategy,ns_per_check,accepted\n";
    for(const auto& c : cases){
        for(size_t n : {10u, 1000u, 100000u}){
            auto value = make_value(c.shape, n);
            for(hintc::Strategy s : {hintc::Strategy::O1, hintc::Strategy::On}){
                // full traversal of the largest inputs is slow; fewer rounds
                int rounds = (s==hintc::Strategy::On && n > 1000) ? 20 : iters;
                auto r = bench_case(cache, c.spec, value, s, rounds);
                std::cout << c.name << "," << n << "," << hintc::strategy_name(s) << ","
                          << r.ns_per_check << "," << r.accepted << "\n";
            }
        }
    }
    return 0;
}
