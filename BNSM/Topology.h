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
 * This class contains the members and methods required for generating and storing the binary component of the model,
 * the random bipartite topology linking plants (rows) and animals (columns)
 */

#ifndef BNSM_TOPOLOGY_H
#define BNSM_TOPOLOGY_H

#include <armadillo>
#include "BNSM_rng.h"

using namespace std;
using namespace arma;

class Topology {
public:
// members
    // parameters
    int P = 0; // number of plant species (rows)
    int A = 0; // number of animal species (columns)
    double c = 0.0; // link probability (target connectance)

    // matrix objects
    mat binMat; // PxA binary adjacency matrix

// methods
    // topo modelling
    void genTopology(BNSM_rng::engine & rng); // draw i.i.d. Bernoulli(c) links
    void checkParams() const; // throws parameter_error on inadmissible P, A, c

    // summary statistics
    double connectance() const; // realized connectance, links/(P*A)
    int links() const; // number of realized links
    bool isEmpty() const; // no link realized
    bool isComplete() const; // all P*A links realized

// (default) constructor
    Topology() {}

// intialization constructor
    Topology(int a_P, int a_A, double a_c) : P(a_P), A(a_A), c(a_c) {}

// (default) deconstructor
    ~Topology() {}
};

#endif //BNSM_TOPOLOGY_H

// Local Variables:
// c-file-style: "stroustrup"
// End:
