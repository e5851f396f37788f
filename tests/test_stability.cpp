/*
 * Community matrix assembly and resilience tests.
 */

#include <iostream>
#include <armadillo>

#include "Interactions.h"
#include "CommunityMatrix.h"
#include "Stability.h"
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

static int test_block_structure() {
    BNSM_rng::engine rng = BNSM_rng::trial_engine(21, 0);
    Interactions net(7, 11, 0.35);
    net.genNetwork(rng);
    int P = 7, S = 18;

    CommunityMatrix mut, ant;
    genCommunityMatrices(net.wMat, mut, ant);

    EXPECT(mut.jacobian.n_rows == (uword) S && mut.jacobian.n_cols == (uword) S, "community matrix is S x S");
    EXPECT(approx_equal(mat(mut.jacobian.submat(0, P, P-1, S-1)), net.wMat, "absdiff", 0.0),
           "upper right block holds W");
    EXPECT(approx_equal(mat(ant.jacobian.submat(0, P, P-1, S-1)), net.wMat, "absdiff", 0.0),
           "plant-on-animal block is positive under antagonism");
    EXPECT(approx_equal(mat(mut.jacobian.submat(P, 0, S-1, P-1)), mat(net.wMat.t()), "absdiff", 0.0),
           "lower left block holds W^T under mutualism");
    EXPECT(approx_equal(mat(ant.jacobian.submat(P, 0, S-1, P-1)), mat(-net.wMat.t()), "absdiff", 0.0),
           "lower left block holds -W^T under antagonism");
    EXPECT(accu(abs(mut.jacobian.submat(0, 0, P-1, P-1) - diagmat(mut.jacobian.submat(0, 0, P-1, P-1)))) == 0.0,
           "no plant-plant interaction");
    EXPECT(accu(abs(mut.jacobian.submat(P, P, S-1, S-1) - diagmat(mut.jacobian.submat(P, P, S-1, S-1)))) == 0.0,
           "no animal-animal interaction");

    mat offDiag = abs(mut.jacobian);
    offDiag.diag().zeros();
    double s = max(sum(offDiag, 1));
    EXPECT(s > 0.0, "non-empty network has interactions");
    EXPECT(all(mut.jacobian.diag() == -s), "diagonal is minus the largest absolute row sum");
    EXPECT(all(ant.jacobian.diag() == mut.jacobian.diag()), "both regimes share the diagonal");
    EXPECT(mut.selfReg == ant.selfReg, "both regimes share the self-regulation magnitude");

    mat diff = mut.jacobian - ant.jacobian;
    diff.submat(P, 0, S-1, P-1).zeros();
    EXPECT(accu(abs(diff)) == 0.0, "variants differ in the lower left block only");
    return 0;
}

static int test_degenerate_network() {
    mat W = zeros<mat>(4, 9);
    CommunityMatrix mut, ant;
    genCommunityMatrices(W, mut, ant);
    EXPECT(mut.isDegenerate() && ant.isDegenerate(), "empty network gives degenerate community matrices");
    EXPECT(resilience(mut) == 0.0, "resilience of the interaction free mutualistic matrix is 0");
    EXPECT(resilience(ant) == 0.0, "resilience of the interaction free antagonistic matrix is 0");
    return 0;
}

static int test_dominant_eigenvalue() {
    mat J = {{1.0, 2.0},
             {0.0, 3.0}};
    cx_double lambda;
    EXPECT(dominantEigenvalue(J, lambda), "decomposition succeeds");
    EXPECT(std::fabs(lambda.real() - 3.0) < 1e-12, "largest real part selected");

    mat R = {{-1.0, -2.0},
             { 2.0, -1.0}};
    EXPECT(dominantEigenvalue(R, lambda), "decomposition succeeds for complex spectra");
    EXPECT(std::fabs(lambda.real() + 1.0) < 1e-12, "real part of a complex pair");
    EXPECT(std::fabs(std::fabs(lambda.imag()) - 2.0) < 1e-12, "imaginary part of a complex pair");

    mat bad = J;
    bad(0,0) = datum::nan;
    EXPECT(!dominantEigenvalue(bad, lambda), "non-finite matrices are reported as failures");
    return 0;
}

static int test_sign_changes_resilience() {
    // the mutualistic off-diagonal part is symmetric, its spectrum is -s +- singular values of W; the antagonistic
    // off-diagonal part is skew-symmetric with purely imaginary spectrum
    BNSM_rng::engine rng = BNSM_rng::trial_engine(21, 1);
    for (int t=0; t<10; t++) {
        Interactions net(5 + t, 12 + t, 0.5);
        net.genNetwork(rng);
        if (net.isEmpty()) {
            continue;
        }
        CommunityMatrix mut, ant;
        genCommunityMatrices(net.wMat, mut, ant);
        double rm = resilience(mut);
        double ra = resilience(ant);
        double sigma = max(svd(net.wMat));

        EXPECT(std::fabs(ra - mut.selfReg) < 1e-9, "antagonistic resilience equals the self-regulation");
        EXPECT(std::fabs(rm - (mut.selfReg - sigma)) < 1e-9, "mutualistic resilience is reduced by sigma_max(W)");
        EXPECT(rm >= -1e-12 && ra >= -1e-12, "diagonal dominance keeps both regimes stable");
        EXPECT(rm != ra, "interaction sign changes resilience");
    }
    return 0;
}

static int test_failed_spectrum() {
    CommunityMatrix cm;
    cm.P = 2;
    cm.A = 2;
    cm.selfReg = 1.0;
    cm.jacobian = -eye<mat>(4, 4);
    cm.jacobian(0, 3) = datum::nan;
    EXPECT(!cm.isDegenerate(), "self-regulated matrix is not degenerate");
    EXPECT(my_isnan(resilience(cm)), "resilience of a non-finite matrix is undefined");

    cm.jacobian(0, 3) = datum::inf;
    EXPECT(my_isnan(resilience(cm)), "resilience of an unbounded matrix is undefined");

    cm.jacobian(0, 3) = 0.5;
    EXPECT(std::fabs(resilience(cm) - 1.0) < 1e-12, "finite matrix recovers its resilience");
    return 0;
}

int main() {
    if (test_block_structure() != 0) return 1;
    if (test_degenerate_network() != 0) return 1;
    if (test_dominant_eigenvalue() != 0) return 1;
    if (test_sign_changes_resilience() != 0) return 1;
    if (test_failed_spectrum() != 0) return 1;
    cout << "stability tests passed" << endl;
    return 0;
}
