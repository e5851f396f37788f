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
 * This class contains the members and methods required for generating and storing the quantitative component of the
 * model, the interaction strengths carried by the links of the binary topology.
 */

#include <iostream>
#include <armadillo>
#include <boost/random.hpp>
#include <boost/random/exponential_distribution.hpp>

#include "Interactions.h"
#include "error.h"

using namespace std;
using namespace arma;

void Interactions::genWeights(BNSM_rng::engine & rng) {

    // summary:
        // draw P*A exponentially distributed strengths and project them onto the simplex
        // the normalization runs over all draws, linked or not, so accu(wMat) equals the expected fraction of linked
        // draws rather than 1; most realized interactions are weak and few are strong

    // arguments:
        // rng - random number engine of the current trial

    // required members:
        // binMat - binary topology, see Topology::genTopology()
        // lambda - rate of the exponential distribution

    // output:
        // wMat - PxA weighted interaction matrix, zero wherever binMat is zero

    if (!(lambda > 0.0)) {
        PARAMETER_ERROR("rate of the interaction strength distribution must be positive, lambda = " << lambda);
    }
    if (binMat.n_elem == 0) {
        FATAL_ERROR("genWeights() called before genTopology()");
    }

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
/////////////////////////////////////////// Sample interaction strengths ///////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

    boost::random::exponential_distribution<double> strength(lambda);
    mat draws(binMat.n_rows, binMat.n_cols);
    for (uword k=0; k<draws.n_elem; k++) {
        draws(k) = strength(rng);
    }

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
////////////////////////////////////////// Normalize and mask non-links ////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

    draws /= accu(draws); // simplex projection over all P*A draws
    wMat = draws % binMat;

    TRACE(accu(wMat), TOPOLOGY);
}

void Interactions::genNetwork(BNSM_rng::engine & rng) {
    genTopology(rng);
    genWeights(rng);
}

mat Interactions::binarize() const {
    mat B = zeros<mat>(wMat.n_rows, wMat.n_cols);
    B.elem(find(wMat > 0.0)).ones();
    return B;
}

void Interactions::save(string filename) const {
    if (!wMat.save(filename, raw_ascii)) {
        FATAL_ERROR("could not write interaction matrix to " << filename);
    }
}

void Interactions::load(string filename) {

    // summary:
        // import a weighted interaction matrix, topology and species numbers are recovered from it

    cout << "\nImporting network " << filename << endl;
    mat W;
    if (!W.load(filename, raw_ascii)) {
        FATAL_ERROR("could not read interaction matrix from " << filename);
    }
    if (W.n_elem == 0 || W.min() < 0.0) {
        PARAMETER_ERROR("interaction matrix in " << filename << " must be non-empty and non-negative");
    }
    wMat = W;
    P = W.n_rows;
    A = W.n_cols;
    binMat = binarize();
    c = connectance();
}

// Local Variables:
// c-file-style: "stroustrup"
// End:
