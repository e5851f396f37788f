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

#include "Topology.h"
#include "error.h"
#include <armadillo>
#include <boost/random/bernoulli_distribution.hpp>

using namespace std;
using namespace arma;

void Topology::checkParams() const {

    if (P < 1) {
        PARAMETER_ERROR("number of plant species must be positive, P = " << P);
    }
    if (A < 1) {
        PARAMETER_ERROR("number of animal species must be positive, A = " << A);
    }
    if (!(c >= 0.0 && c <= 1.0)) { // also rejects nan
        PARAMETER_ERROR("connectance must lie in [0,1], c = " << c);
    }
}

void Topology::genTopology(BNSM_rng::engine & rng) {

    // summary:
        // sample each of the P*A potential plant-animal links independently with probability c
        // realized connectance is a random variable with expectation c, see connectance()

    // arguments:
        // rng - random number engine of the current trial

    // required members:
        // P, A - species richness of the two guilds
        // c - link probability

    // output:
        // binMat - PxA binary adjacency matrix

    checkParams();

    binMat.zeros(P, A);

    boost::random::bernoulli_distribution<double> link(c);
    for (int j=0; j<A; j++) { // column major, matches armadillo storage
        for (int i=0; i<P; i++) {
            if (link(rng)) {
                binMat(i,j) = 1.0;
            }
        }
    }

    TRACE(links(), TOPOLOGY);
}

double Topology::connectance() const {
    if (binMat.n_elem == 0) {
        return datum::nan;
    }
    return accu(binMat) / binMat.n_elem;
}

int Topology::links() const {
    return (int) accu(binMat > 0.0);
}

bool Topology::isEmpty() const {
    return links() == 0;
}

bool Topology::isComplete() const {
    return binMat.n_elem > 0 && links() == (int) binMat.n_elem;
}

// Local Variables:
// c-file-style: "stroustrup"
// End:
