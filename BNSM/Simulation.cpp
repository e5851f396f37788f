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

#include <iostream>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <thread>
#include <mutex>
#include <chrono>
#include <ctime>
#include <exception>
#include <armadillo>
#include <boost/random.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include "Simulation.h"

using namespace std;
using namespace arma;
using namespace boost::filesystem;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
/////////////////////////////////////////////////// Results table //////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

void ResultsTable::append(const vector<SimulationTrial> & block) {
    rows.insert(rows.end(), block.begin(), block.end());
}

static bool trialOrder(const SimulationTrial & a, const SimulationTrial & b) {
    return a.trial < b.trial;
}

void ResultsTable::sortByTrial() {
    std::stable_sort(rows.begin(), rows.end(), trialOrder);
}

void ResultsTable::truncateToPrefix() {
    size_t k = 0;
    while (k < rows.size() && rows[k].trial == (int) k) {
        k++;
    }
    rows.resize(k);
}

vector<string> ResultsTable::columnNames() {
    string names[] = {"trial", "P", "A", "S", "c_target", "links", "connectance", "nestedness", "modularity",
                      "modules", "res_mut", "res_ant"};
    return vector<string>(names, names + sizeof(names) / sizeof(names[0]));
}

mat ResultsTable::asMat() const {
    mat M(rows.size(), columnNames().size());
    for (size_t r=0; r<rows.size(); r++) {
        const SimulationTrial & t = rows[r];
        M(r,0) = t.trial;
        M(r,1) = t.P;
        M(r,2) = t.A;
        M(r,3) = t.S;
        M(r,4) = t.c_target;
        M(r,5) = t.links;
        M(r,6) = t.connectance;
        M(r,7) = t.nestedness;
        M(r,8) = t.modularity;
        M(r,9) = t.modules;
        M(r,10) = t.res_mut;
        M(r,11) = t.res_ant;
    }
    return M;
}

void ResultsTable::save(string filename) const {

    // summary:
        // write the table as comma separated values, one header row followed by one row per trial
        // undefined entries are written as nan

    path p(filename);
    if (p.has_parent_path() && !exists(p.parent_path())) { // make directory if doesn't currently exist
        create_directories(p.parent_path());
    }

    boost::filesystem::ofstream out(p);
    if (!out) {
        FATAL_ERROR("could not open " << filename << " for writing");
    }

    vector<string> names = columnNames();
    for (size_t k=0; k<names.size(); k++) {
        out << (k ? "," : "") << names[k];
    }
    out << "\n";

    mat M = asMat();
    out << setprecision(10);
    for (uword r=0; r<M.n_rows; r++) {
        for (uword k=0; k<M.n_cols; k++) {
            out << (k ? "," : "") << M(r,k);
        }
        out << "\n";
    }

    if (!out) {
        FATAL_ERROR("error while writing " << filename);
    }
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////// Simulation ///////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

Simulation::Simulation() {
    time_t t = time(0);
    struct tm * now = localtime( & t );
    ostringstream dateTemp;
    dateTemp << (now->tm_year + 1900) << '-'
             << (now->tm_mon + 1) << '-'
             <<  now->tm_mday;
    date = dateTemp.str();
}

void Simulation::validate() const {

    // summary:
        // reject inadmissible parameters before any trial runs, no partial results are produced

    if (P_min < 1 || A_min < 1) {
        PARAMETER_ERROR("species richness must be positive, P_min = " << P_min << ", A_min = " << A_min);
    }
    if (P_min > P_max) {
        PARAMETER_ERROR("inverted plant richness range [" << P_min << "," << P_max << "]");
    }
    if (A_min > A_max) {
        PARAMETER_ERROR("inverted animal richness range [" << A_min << "," << A_max << "]");
    }
    if (!(c_min >= 0.0 && c_max <= 1.0)) {
        PARAMETER_ERROR("connectance range [" << c_min << "," << c_max << "] outside [0,1]");
    }
    if (c_min > c_max) {
        PARAMETER_ERROR("inverted connectance range [" << c_min << "," << c_max << "]");
    }
    if (trials < 1) {
        PARAMETER_ERROR("number of trials must be positive, trials = " << trials);
    }
    if (restarts < 1) {
        PARAMETER_ERROR("number of modularity restarts must be positive, restarts = " << restarts);
    }
    if (!(lambda > 0.0)) {
        PARAMETER_ERROR("rate of the interaction strength distribution must be positive, lambda = " << lambda);
    }
    if (workers < 1) {
        PARAMETER_ERROR("number of workers must be positive, workers = " << workers);
    }
}

static SimulationTrial emptyRow(int trial, const Topology & net) {
    SimulationTrial row;
    row.trial = trial;
    row.P = net.P;
    row.A = net.A;
    row.S = net.P + net.A;
    row.c_target = net.c;
    row.links = 0;
    row.connectance = datum::nan;
    row.nestedness = datum::nan;
    row.modularity = datum::nan;
    row.modules = 0;
    row.res_mut = datum::nan;
    row.res_ant = datum::nan;
    return row;
}

// metrics of a failed trial are undefined, even those computed before the failure
static void clearMetrics(SimulationTrial & row) {
    row.nestedness = datum::nan;
    row.modularity = datum::nan;
    row.modules = 0;
    row.res_mut = datum::nan;
    row.res_ant = datum::nan;
}

void Simulation::measure(const Interactions & net, BNSM_rng::engine & rng, SimulationTrial & row) const {

    // summary:
        // structure and stability of an existing network, exceptions are passed on to the caller

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
//////////////////////////////////////////////// Structural metrics ////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

    row.links = net.links();
    row.connectance = net.connectance();

    NetworkMetrics metrics(rng, restarts);
    row.nestedness = metrics.computeNestedness(net.wMat);
    row.modularity = metrics.computeModularity(net.wMat, quantitative);
    row.modules = metrics.numberOfModules();

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
////////////////////////////////////////// Community matrices and stability ////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

    CommunityMatrix mut, ant;
    genCommunityMatrices(net.wMat, mut, ant);
    row.res_mut = resilience(mut);
    row.res_ant = resilience(ant);
}

SimulationTrial Simulation::analyse(Interactions & net, BNSM_rng::engine & rng, int trial) const {

    // summary:
        // draw the network and compute its structure and stability, failures are confined to this trial

    // arguments:
        // net - network with P, A, c and lambda set
        // rng - engine of the trial, consumed in order: topology, weights, modularity search
        // trial - trial index

    // output:
        // one row of the results table, metrics nan if the trial failed

    SimulationTrial row = emptyRow(trial, net);

    try {
        net.genNetwork(rng);
        measure(net, rng, row);
    } catch (parameter_error & e) {
        clearMetrics(row);
        WARNING("trial " << trial << " rejected: " << e.what());
    } catch (terminal_condition & e) {
        clearMetrics(row);
        WARNING("trial " << trial << " failed: " << e.what());
    } catch (std::exception & e) {
        clearMetrics(row);
        WARNING("trial " << trial << " failed: " << e.what());
    }

    if (storeNetworks && net.wMat.n_elem > 0) {
        try {
            net.save(networkFileName(trial));
        } catch (terminal_condition & e) {
            WARNING("interaction matrix of trial " << trial << " not stored");
        }
    }

    TRACE(row.res_mut, DRIVER);
    TRACE(row.res_ant, DRIVER);
    return row;
}

SimulationTrial Simulation::runTrial(int trial) const {

    // summary:
        // sample P, A uniformly from the integer ranges and c uniformly from [c_min, c_max], then analyse the network

    BNSM_rng::engine rng = BNSM_rng::trial_engine(seed, trial);

    boost::random::uniform_int_distribution<int> drawP(P_min, P_max);
    boost::random::uniform_int_distribution<int> drawA(A_min, A_max);
    int P = drawP(rng);
    int A = drawA(rng);
    double c = c_min;
    if (c_max > c_min) { // boost::random::uniform_real_distribution requires a non-empty interval
        boost::random::uniform_real_distribution<double> drawC(c_min, c_max);
        c = drawC(rng);
    }

    Interactions net(P, A, c, lambda);
    return analyse(net, rng, trial);
}

SimulationTrial Simulation::runSingle(int a_P, int a_A, double a_c, int trial) const {
    BNSM_rng::engine rng = BNSM_rng::trial_engine(seed, trial);
    Interactions net(a_P, a_A, a_c, lambda);
    net.checkParams();
    return analyse(net, rng, trial);
}

SimulationTrial Simulation::analyseStored(string filename) const {

    // summary:
        // re-analyse a weighted interaction matrix written by a previous run (see storeNetworks)
        // c_target is the realized connectance of the imported network; the modularity search uses the engine of
        // trial 0

    // arguments:
        // filename - raw_ascii PxA interaction matrix

    Interactions net;
    net.lambda = lambda;
    net.load(filename);

    SimulationTrial row = emptyRow(0, net);
    BNSM_rng::engine rng = BNSM_rng::trial_engine(seed, 0);
    measure(net, rng, row);
    return row;
}

void Simulation::reportProgress(int done) const {
    int block = std::max(1, trials / 10);
    if (done % block == 0 || done == trials) {
        std::lock_guard<std::mutex> lock(io_mutex);
        cout << "\rTrial " << done << " of " << trials << flush;
    }
}

void Simulation::runWorker(int worker, vector<SimulationTrial> & block, std::atomic<int> & done) const {
    for (int t=worker; t<trials; t+=workers) {
        if (exit_now) {
            break;
        }
        block.push_back(runTrial(t));
        reportProgress(++done);
    }
}

void Simulation::run() {

    // summary:
        // run all trials and collect the results table, ordered by trial index
        // trials are independent; with workers > 1 they are distributed round robin over threads, each collecting
        // its rows in a private block, merged and re-sorted once all threads have joined
        // the exit_now flag (see signal_handling()) is polled between trials; on interruption the leading run of
        // completed trials is kept

    validate();

    results.clear();
    if (storeNetworks) {
        create_directories(outputPath());
    }

    auto time1 = std::chrono::system_clock::now();
    std::atomic<int> done(0);

    if (workers == 1) {
        vector<SimulationTrial> block;
        runWorker(0, block, done);
        results.append(block);
    } else {
        vector<vector<SimulationTrial> > blocks(workers);
        vector<std::thread> pool;
        for (int w=0; w<workers; w++) {
            pool.push_back(std::thread(&Simulation::runWorker, this, w, std::ref(blocks[w]), std::ref(done)));
        }
        for (size_t w=0; w<pool.size(); w++) {
            pool[w].join();
        }
        for (int w=0; w<workers; w++) {
            results.append(blocks[w]);
        }
        results.sortByTrial();
    }
    cout << endl;

    if (exit_now) {
        results.truncateToPrefix();
        WARNING("simulation interrupted, " << results.n_rows() << " of " << trials << " trials completed");
    }

    auto time2 = std::chrono::system_clock::now();
    std::chrono::duration<double> elapsed_time = time2 - time1;
    simTime = elapsed_time.count();
    cout << "Simulated " << results.n_rows() << " networks in " << simTime << " seconds" << endl;
}

void Simulation::printParams() const {
    cout << "\nexperiment " << experiment;
    cout << "\ndate " << date;
    cout << "\nrep " << rep;
    cout << "\nseed " << seed;
    cout << "\nP in [" << P_min << "," << P_max << "]";
    cout << "\nA in [" << A_min << "," << A_max << "]";
    cout << "\nc in [" << c_min << "," << c_max << "]";
    cout << "\ntrials " << trials;
    cout << "\nlambda " << lambda;
    cout << "\nmodularity " << (quantitative ? "quantitative" : "binary") << ", restarts " << restarts;
    cout << "\nworkers " << workers << endl;
}

string Simulation::outputPath() const {
    ostringstream p;
    p << outputDirectory;
    if (!outputDirectory.empty() && outputDirectory[outputDirectory.size()-1] != '/') {
        p << "/";
    }
    p << "SimulationData/" << experiment << "_experiment/" << date << "/";
    return p.str();
}

string Simulation::networkFileName(int trial) const {
    ostringstream name;
    name << outputPath() << date << "_" << experiment << "_W" << rep << "_" << trial << ".mat";
    return name.str();
}

string Simulation::saveResults() {

    // summary:
        // generate file name and write the results table

    cout << "\nOutputting data... ";
    ostringstream name;
    name << outputPath() << date << "_" << experiment << "_results" << rep << ".csv";
    string filename = name.str();
    results.save(filename);
    cout << "Results file name: " << filename << endl;
    return filename;
}

// Local Variables:
// c-file-style: "stroustrup"
// End:
