// mutsel info: describe a snapshot file

#include "subcommand.hpp"
#include "mutsel/errors.hpp"
#include "mutsel/snapshot.hpp"

#include <cstring>
#include <iostream>
#include <string>

namespace mutsel {
namespace cli {

int cmd_info(int argc, char* argv[]) {
    std::string path;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            std::cerr << "Usage: mutsel info <snapshot>\n\n";
            std::cerr << "Print the header and summary statistics of a snapshot.\n";
            return 0;
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: Unknown option '" << argv[i] << "'\n";
            return 1;
        } else if (path.empty()) {
            path = argv[i];
        } else {
            std::cerr << "Error: Unexpected argument '" << argv[i] << "'\n";
            return 1;
        }
    }
    if (path.empty()) {
        std::cerr << "Error: info needs a snapshot file\n";
        return 1;
    }

    try {
        const Snapshot s = read_snapshot(path);
        const MeanVarianceSeries mv = snapshot_mean_and_variance(s);
        std::cout << "numeric\t" << numeric_kind_name(s.kind) << "\n";
        std::cout << "classes\t" << s.n_classes << "\n";
        std::cout << "bin_width\t" << s.bin_width << "\n";
        std::cout << "death\t" << s.death << "\n";
        std::cout << "max_growth\t" << s.max_growth << "\n";
        std::cout << "upper_bound\t" << (s.exclude_upper_bound ? "excluded" : "included") << "\n";
        std::cout << "class_stride\t" << s.class_stride << "\n";
        std::cout << "years_per_epoch\t" << s.years_per_epoch << "\n";
        std::cout << "epochs\t" << s.trajectory.size() << "\n";
        if (!s.trajectory.empty()) {
            const size_t last = s.trajectory.size() - 1;
            std::cout << "final_log_scalar\t" << s.log_scalars[last] << "\n";
            std::cout << "final_mean_growth\t" << mv.mean[last] << "\n";
            std::cout << "final_variance_growth\t" << mv.variance[last] << "\n";
        }
        if (s.has_equilibrium) {
            std::cout << "eigenvalue\t" << s.eigenvalue << "\n";
            std::cout << "eigen_error\t" << s.eigen_error << "\n";
        }
        return 0;
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

namespace {
const SubcommandRegistrar registrar({"info", "<snapshot>",
                                     "Describe a snapshot file",
                                     cmd_info, 40});
}

}  // namespace cli
}  // namespace mutsel
