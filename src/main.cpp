#include "AutoConfig.h"
#include "DataSet.h"
#include "GraphIO.h"
#include "Knowledge.h"
#include "Preprocessor.h"
#include "SkewcycleExceptions.h"
#include "SkewcycleSearch.h"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        std::cout << AutoConfig::usage() << "\n";
        return 0;
    }

    try {
        const AutoConfig config = AutoConfig::fromArgs(argc, argv);

        DataSet data = DataSet::fromCSV(config.datasetPath, config.delimiter);
        if (config.search.verbose) {
            std::cout << "[Skewcycle] Dataset Loaded: " << config.datasetPath << "\n";
            data.printSummary();
        }
        Preprocessor::run(data, Preprocessor::parseMethod(config.transform));

        SkewcycleSearch search(data, config.search);
        if (!config.knowledgePath.empty()) {
            search.setKnowledge(Knowledge::fromFile(config.knowledgePath));
        }
        if (!config.initialGraphPath.empty()) {
            search.setInitialGraph(GraphIO::readFile(config.initialGraphPath));
        }

        const auto graph = search.search();
        if (config.outputPath.empty()) {
            GraphIO::write(*graph, std::cout);
        } else {
            GraphIO::writeFile(*graph, config.outputPath);
            if (config.search.verbose) {
                std::cout << "[Skewcycle] Graph written to " << config.outputPath << "\n";
            }
        }
    } catch (const Skewcycle::SkewcycleException& e) {
        std::cerr << "[Skewcycle Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Skewcycle Exception] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
