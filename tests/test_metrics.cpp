/*
 * Nestedness and modularity tests.
 */

#include <iostream>
#include <armadillo>

#include "Interactions.h"
#include "StructuralMetrics.h"
#include "Modularity.h"
#include "BNSM_rng.h"
#include "error.h"

using namespace std;
using namespace arma;

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        cout << "FAIL: " << msg << endl; \
        return 1; \
    } \
} while (0)

// staircase with weights decreasing away from the top left corner, perfectly nested in the weighted sense
static mat nestedStaircase(int n) {
    mat W = zeros<mat>(n, n);
    for (int i=0; i<n; i++) {
        for (int k=0; k<n-i; k++) {
            W(i,k) = (n - i) + (n - k);
        }
    }
    return W;
}

// two disjoint complete 3x3 blocks
static mat twoBlocks() {
    mat M = zeros<mat>(6, 6);
    M.submat(0, 0, 2, 2).ones();
    M.submat(3, 3, 5, 5).ones();
    return M;
}

static int test_nestedness_reference_values() {
    BNSM_rng::engine rng = BNSM_rng::trial_engine(1, 0);
    NetworkMetrics metrics(rng);

    double nodf = metrics.computeNestedness(nestedStaircase(5));
    EXPECT(std::fabs(nodf - 100.0) < 1e-9, "weighted staircase is perfectly nested");
    EXPECT(std::fabs(metrics.nestednessRows - 100.0) < 1e-9, "row component of the staircase");
    EXPECT(std::fabs(metrics.nestednessCols - 100.0) < 1e-9, "column component of the staircase");

    // binary staircase: overlap exists but no weight strictly decreases
    mat B = nestedStaircase(5);
    B.elem(find(B > 0.0)).ones();
    EXPECT(metrics.computeNestedness(B) == 0.0, "equal weights never score in WNODF");

    // disjoint links, all degrees equal
    mat I = eye<mat>(4, 4);
    EXPECT(metrics.computeNestedness(I) == 0.0, "decreasing fill fails for equal degrees");
    return 0;
}

static int test_degenerate_inputs() {
    BNSM_rng::engine rng = BNSM_rng::trial_engine(1, 1);
    NetworkMetrics metrics(rng);

    mat empty = zeros<mat>(5, 8);
    EXPECT(my_isnan(metrics.computeNestedness(empty)), "nestedness of the empty network is undefined");
    EXPECT(my_isnan(metrics.computeModularity(empty, false)), "binary modularity of the empty network is undefined");
    EXPECT(my_isnan(metrics.computeModularity(empty, true)), "weighted modularity of the empty network is undefined");
    EXPECT(metrics.numberOfModules() == 0, "no modules without links");

    mat full = ones<mat>(4, 7);
    EXPECT(my_isnan(metrics.computeModularity(full, false)), "modularity of the complete network is undefined");
    EXPECT(my_isnan(metrics.computeNestedness(full)), "nestedness of the complete network is undefined");
    EXPECT(my_isnan(metrics.nestednessRows) && my_isnan(metrics.nestednessCols), "no component of a complete network");
    mat fullWeighted = full;
    fullWeighted(0, 0) = 3.0;
    EXPECT(my_isnan(metrics.computeNestedness(fullWeighted)), "nestedness undefined for any fully linked network");

    mat single = ones<mat>(1, 1);
    EXPECT(my_isnan(metrics.computeNestedness(single)), "no pairs to compare in a 1x1 network");
    return 0;
}

static int test_modularity_two_blocks() {
    BNSM_rng::engine rng = BNSM_rng::trial_engine(5, 0);
    NetworkMetrics metrics(rng, 5);

    double Q = metrics.computeModularity(twoBlocks(), false);
    EXPECT(std::fabs(Q - 0.5) < 1e-9, "two disjoint complete blocks have Q_B = 1/2");
    EXPECT(metrics.numberOfModules() == 2, "two disjoint blocks form two modules");
    EXPECT(metrics.modules.redLabels(0) == metrics.modules.blueLabels(0), "block one shares a label");
    EXPECT(metrics.modules.redLabels(3) == metrics.modules.blueLabels(3), "block two shares a label");
    EXPECT(metrics.modules.redLabels(0) != metrics.modules.redLabels(3), "blocks are separated");

    BipartiteModules bm;
    bm.prepare(twoBlocks());
    uvec one = zeros<uvec>(6);
    EXPECT(std::fabs(bm.barberQ(one, one)) < 1e-12, "single module partition has Q_B = 0");
    return 0;
}

static int test_metric_ranges_on_random_networks() {
    BNSM_rng::engine rng = BNSM_rng::trial_engine(99, 0);
    for (int t=0; t<20; t++) {
        Interactions net(6 + t, 10 + 2 * t, 0.1 + 0.02 * t);
        net.genNetwork(rng);
        if (net.isEmpty() || net.isComplete()) {
            continue;
        }
        NetworkMetrics metrics(rng, 3);
        double nodf = metrics.computeNestedness(net.wMat);
        double Qb = metrics.computeModularity(net.wMat, false);
        double Qq = metrics.computeModularity(net.wMat, true);
        EXPECT(nodf >= 0.0 && nodf <= 100.0, "nestedness in [0,100]");
        EXPECT(Qb >= 0.0 && Qb <= 1.0, "binary modularity in [0,1]");
        EXPECT(Qq >= 0.0 && Qq <= 1.0, "weighted modularity in [0,1]");
        EXPECT(metrics.numberOfModules() >= 1, "at least one module");
    }
    return 0;
}

static int test_modularity_reproducible() {
    Interactions net(12, 25, 0.2);
    BNSM_rng::engine rngNet = BNSM_rng::trial_engine(8, 0);
    net.genNetwork(rngNet);

    BNSM_rng::engine rngA = BNSM_rng::trial_engine(8, 1);
    BNSM_rng::engine rngB = BNSM_rng::trial_engine(8, 1);
    NetworkMetrics a(rngA, 4), b(rngB, 4);
    double Qa = a.computeModularity(net.wMat, false);
    double Qb = b.computeModularity(net.wMat, false);
    EXPECT(Qa == Qb, "modularity search is reproducible for a fixed engine");
    EXPECT(all(a.modules.redLabels == b.modules.redLabels), "row partition is reproducible");
    EXPECT(all(a.modules.blueLabels == b.modules.blueLabels), "column partition is reproducible");
    return 0;
}

int main() {
    if (test_nestedness_reference_values() != 0) return 1;
    if (test_degenerate_inputs() != 0) return 1;
    if (test_modularity_two_blocks() != 0) return 1;
    if (test_metric_ranges_on_random_networks() != 0) return 1;
    if (test_modularity_reproducible() != 0) return 1;
    cout << "metrics tests passed" << endl;
    return 0;
}
