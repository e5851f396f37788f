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
 * from random initial partitions. The search is a heuristic: for a fixed engine the result is reproducible, but
 * different seeds may converge to different partitions of (near) equal modularity.
 */

#ifndef BNSM_MODULARITY_H
#define BNSM_MODULARITY_H

#include <armadillo>
#include "BNSM_rng.h"

using namespace std;
using namespace arma;

class BipartiteModules {
private:
    mat bMat; // PxA modularity matrix, M_ij - k_i d_j / m
    double m = 0.0; // total link weight
    double tol = 1e-10; // tolerance used to detect ties and improvements

    void stageOne(uvec & redLabels, uvec & blueLabels, double & Q, BNSM_rng::engine & rng) const; // label propagation
    void stageTwo(uvec & redLabels, uvec & blueLabels, double & Q, BNSM_rng::engine & rng) const; // merge modules
    uword bestLabel(const rowvec & scores, const uvec & L, uword & nextLabel, BNSM_rng::engine & rng) const;
public:
// members
    int maxIter = 1000; // cap on label propagation sweeps per stage

    // storage objects, best partition found
    double Q = datum::nan; // bipartite modularity of the best partition
    uvec redLabels; // module label of each row (plant)
    uvec blueLabels; // module label of each column (animal)
    int nModules = 0; // number of non-empty modules spanned by linked species

// methods
    double search(const mat & M, BNSM_rng::engine & rng, int restarts); // maximize Q_B, returns best Q
    double barberQ(const uvec & red, const uvec & blue) const; // Q_B of a given partition of the last searched matrix
    void prepare(const mat & M); // compute bMat and m

    // (default) constructor
    BipartiteModules() {}

    // (default) deconstructor
    ~BipartiteModules() {}
};

// relabel to consecutive integers 0..L-1 in order of first appearance (rows first), returns L
uword compactLabels(uvec & red, uvec & blue);

#endif //BNSM_MODULARITY_H

// Local Variables:
// c-file-style: "stroustrup"
// End:
