#include <CommunicationBus/CommunicationBus.hpp>
#include <Config/ConfigStore.hpp>
#include <DataLogger/DataLogger.hpp>
#include <Session/AnnotationSession.hpp>
#include <Timestamp/StampCodec.hpp>
#include <Visualization/WindowFeed.hpp>
#include <fstream>
#include <iostream>
#include <string>

using namespace watchannotator;

namespace
{
    struct Options
    {
        std::string dataPath;
        std::string configPath;
        std::string logPath;
        std::string feedPath;
    };

    void printUsage()
    {
        std::cerr << "usage: watch_annotator <data-file> [--config <file.yaml>] [--log <file>] [--feed <file>]\n";
    }

    bool parseOptions(int argc, char **argv, Options &options)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            const bool hasValue = i + 1 < argc;
            if (arg == "--config" && hasValue)
                options.configPath = argv[++i];
            else if (arg == "--log" && hasValue)
                options.logPath = argv[++i];
            else if (arg == "--feed" && hasValue)
                options.feedPath = argv[++i];
            else if (options.dataPath.empty() && arg.rfind("--", 0) != 0)
                options.dataPath = arg;
            else
                return false;
        }
        return !options.dataPath.empty();
    }

    void printSummary(const data::TextSummary &summary)
    {
        for (const auto &entry : summary)
        {
            if (entry.kind == data::SummaryEntryKind::Ellipsis)
            {
                std::cout << "      ...\n";
                continue;
            }
            std::cout << (entry.is_anchor ? "  >> " : "     ") << time::StampCodec::format(entry.stamp) << "  "
                      << entry.text.value_or("-") << "\n";
        }
    }

    void printView(const WindowView &view)
    {
        std::cout << toString(view.mode) << " window " << view.start_index << "+" << view.length << " of " << view.size
                  << "  rows [" << view.first_row << ", " << view.last_row << "]  " << view.first_stamp << " -> "
                  << view.last_stamp << "  invalid " << view.invalid_count << "\n";
    }

    void printHelp()
    {
        std::cout << "commands: next prev grow shrink goto <f> mode sensors|gps label <text> key <c> unlabel\n"
                  << "          note <text> valid invalid labels notes show save [path] quit\n";
    }

    void report(bool applied)
    {
        if (!applied)
            std::cout << "(no change)\n";
    }
} // namespace

int main(int argc, char **argv)
{
    Options options;
    if (!parseOptions(argc, argv, options))
    {
        printUsage();
        return 2;
    }

    config::ViewerConfig viewerCfg;
    if (!options.configPath.empty())
    {
        try
        {
            viewerCfg = config::ConfigStore::load(options.configPath);
        }
        catch (const config::ConfigError &e)
        {
            std::cerr << "[main] " << e.what() << "\n";
            return 1;
        }
    }

    bus::CommunicationBus bus;

    logging::LoggerConfig logCfg;
    logCfg.outputPath = options.logPath;
    logging::DataLogger logger(logCfg, bus);
    if (!options.logPath.empty())
        logger.start();

    std::ofstream feedFile;
    if (!options.feedPath.empty())
        feedFile.open(options.feedPath, std::ios::out | std::ios::trunc);
    viz::WindowFeed feed(bus, feedFile);
    if (feedFile.is_open())
        feed.start();

    bus.subscribe([](const ProgressUpdate &p)
                  { std::cout << p.message << "\n"; });
    bus.subscribe([](const TaskCompleted &c)
                  {
                      if (!c.success)
                          std::cout << toString(c.task) << " failed: " << c.error << "\n";
                  });

    session::AnnotationSession session(bus, viewerCfg);

    bus.start();
    session.startLoad(options.dataPath);
    session.wait();

    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line))
    {
        const auto split = line.find(' ');
        const std::string command = line.substr(0, split);
        const std::string argument = split == std::string::npos ? std::string{} : line.substr(split + 1);

        if (command.empty())
            continue;
        if (command == "quit")
            break;

        if (command == "next")
            report(session.stepForward());
        else if (command == "prev")
            report(session.stepBackward());
        else if (command == "grow")
            report(session.growWindow());
        else if (command == "shrink")
            report(session.shrinkWindow());
        else if (command == "goto")
        {
            try
            {
                report(session.gotoFraction(std::stod(argument)));
            }
            catch (const std::exception &)
            {
                std::cout << "goto expects a fraction in [0, 1]\n";
            }
        }
        else if (command == "mode" && argument == "sensors")
            report(session.setMode(ViewMode::Sensors));
        else if (command == "mode" && argument == "gps")
            report(session.setMode(ViewMode::Gps));
        else if (command == "label")
            report(session.annotate(argument));
        else if (command == "key" && argument.size() == 1)
            report(session.annotateWithKey(argument.front()));
        else if (command == "unlabel")
            report(session.removeAnnotation());
        else if (command == "note")
            report(session.addNote(argument));
        else if (command == "valid")
            report(session.markWindowValid());
        else if (command == "invalid")
            report(session.markWindowInvalid());
        else if (command == "labels")
            printSummary(session.labelText());
        else if (command == "notes")
            printSummary(session.noteText());
        else if (command == "show")
        {
            printView(session.windowView());
            std::cout << "first " << session.sensors().firstStamp() << "  now " << session.sensors().currentStamp()
                      << "  last " << session.sensors().lastStamp() << "\n";
        }
        else if (command == "save")
        {
            session.startSave(argument);
            session.wait();
        }
        else
            printHelp();
    }

    if (session.hasUnsavedChanges())
        std::cerr << "[main] exiting with unsaved changes\n";

    session.wait();
    feed.stop();
    bus.stop();
    logger.stop();
}
