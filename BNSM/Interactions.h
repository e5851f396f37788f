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

#ifndef BNSM_INTERACTIONS_H
#define BNSM_INTERACTIONS_H

#include "Topology.h"
#include <armadillo>
#include <string>

using namespace std;
using namespace arma;

class Interactions: public Topology {
public:
// members
    // parameters
    double lambda = 1.0; // rate of the exponential interaction strength distribution

    // matrix objects
    mat wMat; // PxA weighted interaction matrix, entries sum to at most 1

// methods
    void genWeights(BNSM_rng::engine & rng); // exponential weights normalized over all P*A draws, masked by binMat
    void genNetwork(BNSM_rng::engine & rng); // genTopology() followed by genWeights()
    mat binarize() const; // threshold wMat, entries > 0 -> 1

    // book keeping functions
    void save(string filename) const;
    void load(string filename);

    // (default) constructor
    Interactions () {}

    // intialization constructor
    Interactions (int a_P, int a_A, double a_c, double a_lambda = 1.0) : Topology(a_P, a_A, a_c), lambda(a_lambda) {}

    // (default) deconstructor
    ~Interactions () {}
};

#endif //BNSM_INTERACTIONS_H

// Local Variables:
// c-file-style: "stroustrup"
// End:
