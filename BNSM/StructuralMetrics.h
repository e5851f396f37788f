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
 * Structural descriptors of a bipartite interaction matrix. The simulation only depends on the abstract interface
 * StructuralMetricsProvider; NetworkMetrics is the implementation shipped with the model (weighted NODF and Barber's
 * bipartite modularity maximized by label propagation, see Modularity.h).
 */

#ifndef BNSM_STRUCTURALMETRICS_H
#define BNSM_STRUCTURALMETRICS_H

#include <armadillo>
#include "BNSM_rng.h"
#include "Modularity.h"

using namespace std;
using namespace arma;

class StructuralMetricsProvider {
public:
    // nestedness in [0,100], nan if undefined
    virtual double computeNestedness(const mat & W) = 0;
    // modularity in [0,1], nan if undefined; quantitative selects weighted over binary modularity
    virtual double computeModularity(const mat & W, bool quantitative) = 0;
    // number of modules found by the last call to computeModularity(), 0 if undefined
    virtual int numberOfModules() const {return 0;};

    virtual ~StructuralMetricsProvider() {}
};

class NetworkMetrics : public StructuralMetricsProvider {
private:
    BNSM_rng::engine & rng; // engine of the current trial, consumed by the modularity search
public:
// members
    int restarts = 10; // number of restarts of the modularity search from random initial partitions

    // storage objects, last evaluation
    double nestednessRows = datum::nan; // WNODF computed over row (plant) pairs only
    double nestednessCols = datum::nan; // WNODF computed over column (animal) pairs only
    BipartiteModules modules; // best partition of the last modularity search

// methods
    virtual double computeNestedness(const mat & W);
    virtual double computeModularity(const mat & W, bool quantitative);
    virtual int numberOfModules() const;

    // intialization constructor
    NetworkMetrics(BNSM_rng::engine & a_rng, int a_restarts = 10) : rng(a_rng), restarts(a_restarts) {}

    // (default) deconstructor
    virtual ~NetworkMetrics() {}
};

// pairwise WNODF score summed over all pairs of rows of W, npairs returns the number of pairs
double wnodfRowSum(const mat & W, double & npairs);

#endif //BNSM_STRUCTURALMETRICS_H

// Local Variables:
// c-file-style: "stroustrup"
// End:
