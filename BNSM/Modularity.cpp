////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
///////////////////////////////////// The Bipartite Network Stability Model (BNSM) /////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
////////////// Random bipartite interaction networks: structure, community matrices and linear stability //////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

/*
    Copyright (C) 2022  Jacob D. O'Sullivan, Axel G. Rossberg

    This file is part of BNSM

    BNSM is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/



/*
 * This class contains the members and methods required for partitioning a bipartite network into modules. Barber's
 * bipartite modularity Q_B is maximized by weighted label propagation with a module merging stage (LPAwb+), restarted
 * from random initial partitions.
 */

#include <iostream>
#include <algorithm>
#include <limits>
#include <map>
#include <armadillo>
#include <boost/random.hpp>
#include <boost/random/uniform_int_distribution.hpp>

#include "Modularity.h"
#include "error.h"

using namespace std;
using namespace arma;

// columns of the returned matrix indicate membership of each node in the sorted label set L
static mat labelIndicator(const uvec & labels, const uvec & L) {
    mat I = zeros<mat>(labels.n_elem, L.n_elem);
    for (uword i=0; i<labels.n_elem; i++) {
        const uword * pos = std::lower_bound(L.begin(), L.end(), labels(i));
        I(i, pos - L.begin()) = 1.0;
    }
    return I;
}

uword compactLabels(uvec & red, uvec & blue) {
    std::map<uword, uword> relabel;
    for (uword i=0; i<red.n_elem; i++) {
        if (relabel.find(red(i)) == relabel.end()) {
            uword next = relabel.size();
            relabel[red(i)] = next;
        }
        red(i) = relabel[red(i)];
    }
    for (uword j=0; j<blue.n_elem; j++) {
        if (relabel.find(blue(j)) == relabel.end()) {
            uword next = relabel.size();
            relabel[blue(j)] = next;
        }
        blue(j) = relabel[blue(j)];
    }
    return relabel.size();
}

void BipartiteModules::prepare(const mat & M) {

    // summary:
        // modularity matrix of the bipartite configuration null model, B_ij = M_ij - k_i d_j / m

    m = accu(M);
    vec k = sum(M, 1); // row (plant) degrees or strengths
    rowvec d = sum(M, 0); // column (animal) degrees or strengths
    if (m > 0.0) {
        bMat = M - (k * d) / m;
    } else {
        bMat.zeros(M.n_rows, M.n_cols);
    }
}

double BipartiteModules::barberQ(const uvec & red, const uvec & blue) const {
    double q = 0.0;
    for (uword j=0; j<bMat.n_cols; j++) {
        for (uword i=0; i<bMat.n_rows; i++) {
            if (red(i) == blue(j)) {
                q += bMat(i,j);
            }
        }
    }
    return q / m;
}

uword BipartiteModules::bestLabel(const rowvec & scores, const uvec & L, uword & nextLabel,
                                  BNSM_rng::engine & rng) const {

    // summary:
        // label maximizing the node's contribution to Q_B, ties broken uniformly at random
        // a node that would only lose by joining any existing module opens a module of its own

    double best = scores.max();
    if (best < -tol * m) {
        return nextLabel++;
    }
    uvec ties = find(scores >= best - tol * m);
    uword pick = 0;
    if (ties.n_elem > 1) {
        boost::random::uniform_int_distribution<uword> draw(0, ties.n_elem - 1);
        pick = draw(rng);
    }
    return L(ties(pick));
}

void BipartiteModules::stageOne(uvec & red, uvec & blue, double & Qstage, BNSM_rng::engine & rng) const {

    // summary:
        // alternate label updates of the column (blue) and row (red) nodes until Q_B stops increasing
        // each half step maximizes Q_B with the labels of the other guild fixed, so Q_B is non-decreasing

    // arguments:
        // red, blue - initial labels, overwritten by the converged partition; blue labels are recomputed first
        // Qstage - overwritten by Q_B of the converged partition

    uword nextLabel = std::max(red.max(), blue.max()) + 1;
    double Qold = -std::numeric_limits<double>::infinity();

    for (int it=0; it<maxIter; it++) {
        // blue nodes adopt labels present among red nodes
        uvec L = unique(red);
        mat S = bMat.t() * labelIndicator(red, L);
        for (uword j=0; j<blue.n_elem; j++) {
            rowvec s = S.row(j);
            blue(j) = bestLabel(s, L, nextLabel, rng);
        }

        // red nodes adopt labels present among blue nodes
        L = unique(blue);
        S = bMat * labelIndicator(blue, L);
        for (uword i=0; i<red.n_elem; i++) {
            rowvec s = S.row(i);
            red(i) = bestLabel(s, L, nextLabel, rng);
        }

        double Qnew = barberQ(red, blue);
        if (Qnew <= Qold + tol) {
            break;
        }
        Qold = Qnew;
    }

    Qstage = barberQ(red, blue);
}

void BipartiteModules::stageTwo(uvec & red, uvec & blue, double & Qstage, BNSM_rng::engine & rng) const {

    // summary:
        // greedily merge the pair of modules with the largest positive gain in Q_B and re-propagate labels, until no
        // merger improves the partition

    for (int it=0; it<maxIter; it++) {
        uword nL = compactLabels(red, blue);
        if (nL < 2) {
            break;
        }

        // C(u,v) - summed modularity matrix between red nodes in u and blue nodes in v
        uvec L = regspace<uvec>(0, nL - 1);
        mat C = labelIndicator(red, L).t() * bMat * labelIndicator(blue, L);
        mat dQ = (C + C.t()) / m;
        dQ.diag().fill(-datum::inf);

        uword k = dQ.index_max();
        double gain = dQ(k);
        uword u = k % dQ.n_rows;
        uword v = k / dQ.n_rows;
        if (gain <= tol) {
            break;
        }
        if (u > v) {
            std::swap(u, v);
        }

        red.elem(find(red == v)).fill(u);
        blue.elem(find(blue == v)).fill(u);

        TRACE(gain, METRICS);
        stageOne(red, blue, Qstage, rng);
    }

    Qstage = barberQ(red, blue);
}

double BipartiteModules::search(const mat & M, BNSM_rng::engine & rng, int restarts) {

    // summary:
        // maximize Barber's bipartite modularity over partitions of rows and columns jointly
        // the first run starts from singleton row modules, subsequent runs from random row partitions into a random
        // number of modules; the best partition over all runs is retained
        // the single module partition (Q_B = 0) is always a candidate, so Q is in [0,1)

    // arguments:
        // M - PxA binary or weighted interaction matrix, non-negative
        // rng - random number engine, used for initial partitions and tie breaking
        // restarts - total number of runs (at least one)

    // output:
        // Q, redLabels, blueLabels, nModules - best partition found; Q is nan if M carries no links

    prepare(M);

    Q = datum::nan;
    nModules = 0;
    redLabels.reset();
    blueLabels.reset();
    if (!(m > 0.0)) {
        return Q;
    }

    const uword P = M.n_rows;
    const uword A = M.n_cols;

    double bestQ = 0.0;
    uvec bestRed = zeros<uvec>(P);
    uvec bestBlue = zeros<uvec>(A);

    int runs = std::max(restarts, 1);
    for (int r=0; r<runs; r++) {
        uvec red(P);
        uvec blue = zeros<uvec>(A);
        if (r == 0) {
            red = regspace<uvec>(0, P - 1);
        } else {
            boost::random::uniform_int_distribution<uword> nInit(1, P);
            boost::random::uniform_int_distribution<uword> label(0, nInit(rng) - 1);
            for (uword i=0; i<P; i++) {
                red(i) = label(rng);
            }
        }

        double q;
        stageOne(red, blue, q, rng);
        stageTwo(red, blue, q, rng);

        DEBUG("modularity run " << r << " Q = " << q);
        if (q > bestQ + tol) {
            bestQ = q;
            bestRed = red;
            bestBlue = blue;
        }
    }

    compactLabels(bestRed, bestBlue);
    Q = bestQ;
    redLabels = bestRed;
    blueLabels = bestBlue;

    // count modules spanned by species with at least one link
    vec k = sum(M, 1);
    rowvec d = sum(M, 0);
    uvec linkedRed = redLabels.elem(find(k > 0.0));
    uvec linkedBlue = blueLabels.elem(find(d > 0.0));
    uvec used = unique(join_cols(linkedRed, linkedBlue));
    nModules = used.n_elem;

    TRACE(Q, METRICS);
    return Q;
}

// Local Variables:
// c-file-style: "stroustrup"
// End:
