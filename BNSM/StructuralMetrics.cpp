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
 * Structural descriptors of a bipartite interaction matrix: weighted nestedness (WNODF) and bipartite modularity.
 */

#include <iostream>
#include <algorithm>
#include <armadillo>

#include "StructuralMetrics.h"
#include "error.h"

using namespace std;
using namespace arma;

double wnodfRowSum(const mat & W, double & npairs) {

    // summary:
        // for each pair of rows the row with more links (i) is compared to the row with fewer links (j); the pair
        // scores 100 * (links of j that are weaker than the corresponding interaction of i) / (links of j)
        // pairs of equal degree fail decreasing fill and score 0, as do pairs in which j has no link

    // arguments:
        // W - weighted interaction matrix, rows are compared
        // npairs - overwritten by the number of row pairs, n(n-1)/2

    // output:
        // sum of the pairwise scores

    const uword n = W.n_rows;
    npairs = 0.5 * n * (n - 1.0);

    umat present = W > 0.0;
    uvec degree = sum(present, 1);

    double total = 0.0;
    for (uword a=0; a<n; a++) {
        for (uword b=a+1; b<n; b++) {
            uword i = a, j = b;
            if (degree(j) > degree(i)) {
                std::swap(i, j);
            }
            if (degree(i) == degree(j) || degree(j) == 0) {
                continue; // decreasing fill violated
            }
            uword kij = 0;
            for (uword k=0; k<W.n_cols; k++) {
                if (W(j,k) > 0.0 && W(i,k) > W(j,k)) {
                    kij++;
                }
            }
            total += 100.0 * kij / degree(j);
        }
    }
    return total;
}

double NetworkMetrics::computeNestedness(const mat & W) {

    // summary:
        // weighted NODF, mean pairwise score over all row pairs and all column pairs, in [0,100]
        // nan if W has no links, every cell is linked (no pair differs in fill) or no pair of rows or columns exists

    nestednessRows = datum::nan;
    nestednessCols = datum::nan;

    uword nLinks = accu(W > 0.0);
    if (W.n_elem == 0 || nLinks == 0 || nLinks == W.n_elem) {
        return datum::nan;
    }

    double rowPairs, colPairs;
    double rowSum = wnodfRowSum(W, rowPairs);
    mat Wt = W.t();
    double colSum = wnodfRowSum(Wt, colPairs);

    if (rowPairs > 0) {
        nestednessRows = rowSum / rowPairs;
    }
    if (colPairs > 0) {
        nestednessCols = colSum / colPairs;
    }
    if (rowPairs + colPairs == 0) {
        return datum::nan;
    }

    double nodf = (rowSum + colSum) / (rowPairs + colPairs);
    TRACE(nodf, METRICS);
    return nodf;
}

double NetworkMetrics::computeModularity(const mat & W, bool quantitative) {

    // summary:
        // best bipartite modularity found by the label propagation search, in [0,1)
        // the binary matrix is used unless quantitative is set
        // nan if W has no links, or every potential link is realized (no partition beats the single module)

    modules.Q = datum::nan;
    modules.nModules = 0;

    uword nLinks = accu(W > 0.0);
    if (W.n_elem == 0 || nLinks == 0 || nLinks == W.n_elem) {
        return datum::nan;
    }

    mat M;
    if (quantitative) {
        M = W;
    } else {
        M = conv_to<mat>::from(W > 0.0);
    }

    return modules.search(M, rng, restarts);
}

int NetworkMetrics::numberOfModules() const {
    return modules.nModules;
}

// Local Variables:
// c-file-style: "stroustrup"
// End:
