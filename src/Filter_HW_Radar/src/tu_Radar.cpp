// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarConfig.h"
#include "CRadarConnectionManager.h"
#include "CRadarViewer.h"
#include <opencv2/highgui.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>

static const char* const WINDOW_NAME = "Radar Data Display";

void showUsage()
{
    printf("\nUsage:\n"
        "tu_Radar [options]\n\n"
        "  --sim                # Simulated sensor\n"
        "  --ws address         # Live sensor on a websocket server [default ws://localhost:4000]\n"
        "  --config file        # JSON configuration file\n"
        "  --log level          # trace, debug, info, warning, error, critical, off\n"
        "\n"
        "eg: tu_Radar --ws ws://192.168.1.20:4000\n");
    exit(1);
}

int main(int argc, char** argv)
{
    CRadarConfig config;
    std::string sConfigFile;
    std::string sInterface;
    std::string sAddress;
    std::string sLogLevel;

    // Read arguments
    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "--sim") == 0)
        {
            sInterface = "sim";
            continue;
        }
        else if (strcmp(argv[i], "--ws") == 0 && i + 1 < argc)
        {
            sInterface = "websocket";
            sAddress = argv[i + 1];
            ++i;
            continue;
        }
        else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc)
        {
            sConfigFile = argv[i + 1];
            ++i;
            continue;
        }
        else if (strcmp(argv[i], "--log") == 0 && i + 1 < argc)
        {
            sLogLevel = argv[i + 1];
            ++i;
            continue;
        }

        printf("\nUnrecognized option : %s\n", argv[i]);
        showUsage();
    }

    if (!sConfigFile.empty() && !CRadarConfig::fromJsonFile(sConfigFile, config))
        return EXIT_FAILURE;

    // Command line wins over the configuration file
    if (!sInterface.empty())
        config.interfaceType = sInterface;
    if (!sAddress.empty())
        config.serverAddress = sAddress;
    if (!sLogLevel.empty())
        config.logLevel = sLogLevel;

    config.sanitize();
    config.applyLogLevel();

    CRadarViewer viewer(config.surfaceRadius);
    CRadarConnectionManager manager(config);

    if (!manager.start())
        return EXIT_FAILURE;

    cv::namedWindow(WINDOW_NAME, cv::WINDOW_AUTOSIZE);

    while (true)
    {
        manager.dispatchEvents(viewer);
        cv::imshow(WINDOW_NAME, viewer.render());

        const int key = cv::waitKey(30);
        if (key == 27 || key == 'q')
            break;

        // Window closed by the user
        if (cv::getWindowProperty(WINDOW_NAME, cv::WND_PROP_VISIBLE) < 1.)
            break;
    }

    manager.stop();
    cv::destroyAllWindows();

    spdlog::info("tu_Radar: {} reports, {} dropped messages, {} connection attempts",
        manager.getReportCount(), manager.getDecodeErrorCount(), manager.getConnectAttemptCount());

    return EXIT_SUCCESS;
}
