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
 * This class contains the members and methods required for running ensembles of random bipartite networks through
 * the structure and stability analysis, collecting one row of summary statistics per network, and outputting data
 */

#ifndef BNSM_SIMULATION_H
#define BNSM_SIMULATION_H

#include <iostream>
#include <atomic>
#include <string>
#include <vector>
#include <armadillo>

#include "BNSM_rng.h"
#include "Interactions.h"
#include "StructuralMetrics.h"
#include "CommunityMatrix.h"
#include "Stability.h"
#include "error.h"

using namespace std;
using namespace arma;

// summary statistics of a single simulated network
struct SimulationTrial {
    int trial; // index of the trial, rows of the results table are ordered by it
    int P; // plant species
    int A; // animal species
    int S; // total diversity P+A
    double c_target; // drawn link probability
    int links; // realized number of links
    double connectance; // realized connectance
    double nestedness; // WNODF in [0,100], nan if undefined
    double modularity; // Q_B in [0,1], nan if undefined
    int modules; // number of modules of the best partition, 0 if undefined
    double res_mut; // resilience, mutualistic community matrix
    double res_ant; // resilience, antagonistic community matrix
};

class ResultsTable {
private:
    vector<SimulationTrial> rows;
public:
// methods
    void append(const SimulationTrial & row) {rows.push_back(row);};
    void append(const vector<SimulationTrial> & block); // append a block of rows, e.g. from one worker
    void sortByTrial(); // restore trial order after parallel collection
    void truncateToPrefix(); // keep the leading run of consecutive trials 0,1,2,...
    void clear() {rows.clear();};

    size_t n_rows() const {return rows.size();};
    const SimulationTrial & operator[](size_t i) const {return rows[i];};
    const vector<SimulationTrial> & trials() const {return rows;};

    static vector<string> columnNames();
    mat asMat() const; // numeric view, one column per entry of columnNames()
    void save(string filename) const; // csv with header row
};

class Simulation {
public:
// members
    // parameters
    int P_min = 8; // plant species richness range
    int P_max = 30;
    int A_min = 16; // animal species richness range
    int A_max = 60;
    double c_min = 0.05; // connectance range
    double c_max = 0.5;
    int trials = 1000; // number of simulated networks
    bool quantitative = false; // quantitative (weighted) instead of binary modularity
    int restarts = 10; // modularity search restarts
    double lambda = 1.0; // rate of the exponential interaction strength distribution
    unsigned int seed = BNSM_rng::draw_seed(); // global seed, each trial derives its own engine from it
    int workers = 1; // worker threads, 1 runs the trials sequentially

    // storage objects
    ResultsTable results;

    // data handling objects
    string outputDirectory;
    string experiment = "DEFAULT";
    int rep = 0;
    string date;
    double simTime = 0;

    // switches
    bool storeNetworks = false; // write each trial's interaction matrix next to the results table

// methods
    void validate() const; // throws parameter_error before any trial runs
    SimulationTrial runTrial(int trial) const; // draw parameters and analyse one network
    SimulationTrial runSingle(int a_P, int a_A, double a_c, int trial = 0) const; // analyse one network, fixed P, A, c
    SimulationTrial analyseStored(string filename) const; // analyse a network imported from file
    void run(); // run all trials, results ordered by trial index
    void printParams() const;
    string saveResults(); // returns the path of the results file

    // (default) constructor
    Simulation();

    // (default) deconstructor
    ~Simulation () {}

private:
    SimulationTrial analyse(Interactions & net, BNSM_rng::engine & rng, int trial) const;
    void measure(const Interactions & net, BNSM_rng::engine & rng, SimulationTrial & row) const;
    string outputPath() const; // directory receiving all files of this experiment
    string networkFileName(int trial) const;
    void runWorker(int worker, vector<SimulationTrial> & block, std::atomic<int> & done) const;
    void reportProgress(int done) const;
};

#endif //BNSM_SIMULATION_H

// Local Variables:
// c-file-style: "stroustrup"
// End:
