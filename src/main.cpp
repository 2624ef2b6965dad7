// main.cpp
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
#include <ctime>
#include <cstdlib>  // EXIT_SUCCESS / EXIT_FAILURE
#include <omp.h>

#include "Camera.h"
#include "Config.h"
#include "ImageIO.h"
#include "Sequence.h"
#include "Tracker.h"
#include "error.hpp"

inline void init_omp_global(int n_threads = 0) {
    omp_set_dynamic(0);

#if defined(_MSC_VER) && !defined(__clang__)
    omp_set_nested(1);   // MSVC vcomp has no omp_set_max_active_levels
#else
    omp_set_max_active_levels(2);  // frames, then cameras
#endif

    const int hw = std::max(1, omp_get_num_procs());
    const int n  = (n_threads > 0) ? std::min(n_threads, hw) : hw; // 0/negative => use all threads

    if (!omp_in_parallel()) omp_set_num_threads(n);
}

// -------------------- core --------------------
// mode: sequence | track | backtrack | both | all (sequence, then both)
int run_openptv(const std::string& config_path, const std::string& mode) {

    const std::vector<std::string> mode_list = {"sequence", "track", "backtrack", "both", "all"};
    if (std::find(mode_list.begin(), mode_list.end(), mode) == mode_list.end()) {
        std::cerr << "Error: unknown mode '" << mode
                  << "', expected sequence|track|backtrack|both|all" << std::endl;
        return EXIT_FAILURE;
    }

    try {
        PTVSetting setting;
        setting.readConfig(config_path);

        init_omp_global(setting._n_thread);

        std::cout << "**************" << std::endl;
        std::cout << "OpenPTV start!" << std::endl;
        std::cout << "**************\n" << std::endl;

        clock_t start = clock();

        if (mode == "sequence" || mode == "all") {
            std::vector<Camera> cams = setting.loadCameras();
            TiffImageSource img_src(setting._img_base_list);
            SequenceSummary summary = runSequence(setting, img_src, cams);
            summary.print(std::cout);
        }

        if (mode == "track") {
            runTracking(setting, TrackDirection::Forward);
        } else if (mode == "backtrack") {
            runTracking(setting, TrackDirection::Backward);
        } else if (mode == "both" || mode == "all") {
            runTracking(setting, TrackDirection::Both);
        }

        clock_t end = clock();

        std::cout << "\nTotal time: "
                  << double(end - start) / CLOCKS_PER_SEC << "s\n" << std::endl;
        std::cout << "***************" << std::endl;
        std::cout << "OpenPTV finish!" << std::endl;
        std::cout << "***************" << std::endl;
    }
    catch (const FatalError& e) {
        std::cerr << "Program aborted due to error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e) {
        std::cerr << "Unhandled std exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

// -------------------- CLI --------------------
#ifdef OPENPTV_BUILD_CLI

int main(int argc, char* argv[]) {

    if (argc != 2 && argc != 3) {
        std::cerr << "Usage: OpenPTV <config_file_path> [sequence|track|backtrack|both|all]" << std::endl;
        return EXIT_FAILURE;
    }

    return run_openptv(argv[1], argc == 3 ? argv[2] : "all");
}

#endif
