/*
 * Random topology and interaction strength tests.
 */

#include <iostream>
#include <armadillo>
#include <boost/filesystem.hpp>

#include "Interactions.h"
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

static int test_realized_connectance_converges() {
    BNSM_rng::engine rng = BNSM_rng::trial_engine(17, 0);
    Topology topo(40, 50, 0.3);
    topo.genTopology(rng);
    EXPECT(topo.binMat.n_rows == 40 && topo.binMat.n_cols == 50, "topology has shape P x A");
    EXPECT(accu(topo.binMat == 0.0) + accu(topo.binMat == 1.0) == topo.binMat.n_elem, "topology is binary");
    EXPECT(std::fabs(topo.connectance() - 0.3) < 0.05, "realized connectance close to c for P*A >= 1000");
    EXPECT(topo.links() == (int) accu(topo.binMat), "links counts the ones");
    return 0;
}

static int test_extreme_connectance() {
    BNSM_rng::engine rng = BNSM_rng::trial_engine(3, 1);
    Topology empty(6, 9, 0.0);
    empty.genTopology(rng);
    EXPECT(empty.isEmpty(), "c = 0 gives an empty network");
    EXPECT(empty.connectance() == 0.0, "c = 0 gives zero connectance");

    Topology full(6, 9, 1.0);
    full.genTopology(rng);
    EXPECT(full.isComplete(), "c = 1 gives a complete network");
    EXPECT(full.connectance() == 1.0, "c = 1 gives unit connectance");
    return 0;
}

static int test_invalid_parameters() {
    BNSM_rng::engine rng = BNSM_rng::trial_engine(3, 2);
    bool thrown = false;
    try {
        Topology topo(0, 5, 0.5);
        topo.genTopology(rng);
    } catch (parameter_error & e) {
        thrown = true;
    }
    EXPECT(thrown, "P = 0 is rejected");

    thrown = false;
    try {
        Topology topo(5, 5, 1.5);
        topo.genTopology(rng);
    } catch (parameter_error & e) {
        thrown = true;
    }
    EXPECT(thrown, "c > 1 is rejected");

    thrown = false;
    try {
        Interactions net(5, 5, 0.5, 0.0);
        net.genNetwork(rng);
    } catch (parameter_error & e) {
        thrown = true;
    }
    EXPECT(thrown, "non-positive exponential rate is rejected");
    return 0;
}

static int test_weights_masked_and_normalized() {
    BNSM_rng::engine rng = BNSM_rng::trial_engine(11, 4);
    Interactions net(20, 35, 0.4);
    net.genNetwork(rng);

    EXPECT(net.wMat.min() >= 0.0, "weights are non-negative");
    EXPECT(accu(net.wMat % (1.0 - net.binMat)) == 0.0, "non-links carry exactly zero weight");
    vec linked = net.wMat.elem(find(net.binMat > 0.0));
    EXPECT(linked.n_elem > 0 && linked.min() > 0.0, "links carry positive weight");
    EXPECT(accu(net.wMat) <= 1.0 + 1e-12, "masked weights sum to at most one");
    EXPECT(approx_equal(net.binarize(), net.binMat, "absdiff", 0.0), "binarized weights reproduce the topology");

    Interactions full(7, 13, 1.0);
    full.genNetwork(rng);
    EXPECT(std::fabs(accu(full.wMat) - 1.0) < 1e-12, "unmasked draws lie on the simplex");
    return 0;
}

static int test_same_seed_same_network() {
    Interactions a(5, 12, 0.5), b(5, 12, 0.5);
    BNSM_rng::engine rngA = BNSM_rng::trial_engine(2024, 7);
    BNSM_rng::engine rngB = BNSM_rng::trial_engine(2024, 7);
    a.genNetwork(rngA);
    b.genNetwork(rngB);
    EXPECT(approx_equal(a.binMat, b.binMat, "absdiff", 0.0), "topology is reproducible for a fixed seed");
    EXPECT(approx_equal(a.wMat, b.wMat, "absdiff", 0.0), "weights are reproducible for a fixed seed");

    Interactions other(5, 12, 0.5);
    BNSM_rng::engine rngC = BNSM_rng::trial_engine(2024, 8);
    other.genNetwork(rngC);
    EXPECT(!approx_equal(a.wMat, other.wMat, "absdiff", 0.0), "different trials draw different networks");
    return 0;
}

static int test_stored_network_reloads() {
    BNSM_rng::engine rng = BNSM_rng::trial_engine(5, 5);
    Interactions net(6, 10, 0.4);
    net.genNetwork(rng);

    string filename = (boost::filesystem::temp_directory_path() /
                       boost::filesystem::unique_path("bnsm-W-%%%%-%%%%.mat")).string();
    net.save(filename);

    Interactions loaded;
    loaded.load(filename);
    boost::filesystem::remove(filename);

    EXPECT(loaded.P == 6 && loaded.A == 10, "species numbers recovered from the matrix");
    EXPECT(approx_equal(loaded.binMat, net.binMat, "absdiff", 0.0), "topology recovered from the weights");
    EXPECT(approx_equal(loaded.wMat, net.wMat, "reldiff", 1e-6), "weights recovered");
    EXPECT(loaded.c == net.connectance(), "connectance set to the realized value");
    return 0;
}

int main() {
    if (test_realized_connectance_converges() != 0) return 1;
    if (test_extreme_connectance() != 0) return 1;
    if (test_invalid_parameters() != 0) return 1;
    if (test_weights_masked_and_normalized() != 0) return 1;
    if (test_same_seed_same_network() != 0) return 1;
    if (test_stored_network_reloads() != 0) return 1;
    cout << "network tests passed" << endl;
    return 0;
}
