#include <catch2/catch_test_macros.hpp>
#include <RowStore/SensorStore.hpp>
#include <TabularIO/TabularReader.hpp>
#include <TabularIO/TabularWriter.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace watchannotator;

namespace
{
    const time::Stamp kBase = *time::StampCodec::parse("2021-05-01 10:00:00");

    std::string stampText(int second)
    {
        return time::StampCodec::format(kBase + std::chrono::seconds{second});
    }

    // stamp,activity_label rows one second apart.
    std::string labelledFile(const std::vector<std::string> &labels)
    {
        std::string text = "stamp,activity_label\ndt,s\n";
        for (std::size_t i = 0; i < labels.size(); ++i)
            text += stampText(static_cast<int>(i)) + "," + labels[i] + "\n";
        return text;
    }

    std::string sequentialFile(std::size_t rows)
    {
        std::string text = "stamp,latitude,longitude\ndt,f,f\n";
        for (std::size_t i = 0; i < rows; ++i)
            text += stampText(static_cast<int>(i)) + ",47.0," + std::to_string(i / 10) + "\n";
        return text;
    }

    void loadText(data::SensorStore &store, gps::GpsTrack &track, const std::string &text,
                  const ProgressCallbacks &callbacks = {})
    {
        std::istringstream in(text);
        io::TabularReader reader(in);
        store.load(reader, track, callbacks);
    }

    struct CountingSink : io::RecordSink
    {
        int headers = 0;
        int rows = 0;
        int finishes = 0;

        void writeHeader(const io::Schema &) override { ++headers; }
        void writeRow(const io::Row &) override { ++rows; }
        void finish() override { ++finishes; }
    };

    struct Recorder
    {
        std::vector<std::string> messages;
        int completions = 0;

        ProgressCallbacks callbacks()
        {
            ProgressCallbacks cb;
            cb.onProgress = [this](const std::string &m)
            { messages.push_back(m); };
            cb.onComplete = [this]
            { ++completions; };
            return cb;
        }
    };
} // namespace

TEST_CASE("SensorStore appends reserved fields the file lacks", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    loadText(store, track, "stamp,heart_rate\ndt,f\n" + stampText(0) + ",61\n");

    const auto &fields = store.schema().columns.fields();
    REQUIRE(fields.size() == 6);
    REQUIRE(fields[2].name == "activity_label");
    REQUIRE(fields[3].name == "user_activity_label");
    REQUIRE(fields[4].name == "is_gps_valid");
    REQUIRE(fields[5].name == "notes");
    REQUIRE_FALSE(store.schema().hasActivityLabel);

    REQUIRE(store.size() == 1);
    REQUIRE(std::get<double>(*store.value(0, "heart_rate")) == 61.0);
    REQUIRE(std::get<std::string>(*store.value(0, "is_gps_valid")) == "1");
    REQUIRE(io::isNull(*store.value(0, "activity_label")));
    REQUIRE_FALSE(store.value(0, "no_such_field").has_value());
    REQUIRE(store.isGpsValid(0));
    REQUIRE_FALSE(store.isDirty());
    REQUIRE(store.hasData());
}

TEST_CASE("SensorStore requires a stamp field", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    REQUIRE_THROWS_AS(loadText(store, track, "latitude\nf\n1.0\n"), io::SchemaError);
    REQUIRE_FALSE(store.hasData());
    REQUIRE(store.size() == 0);
}

TEST_CASE("SensorStore is left empty after a failed load", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    loadText(store, track, sequentialFile(20));
    REQUIRE(store.hasData());
    REQUIRE(track.hasData());

    const std::string broken = "stamp,latitude,longitude\ndt,f,f\n" + stampText(0) + ",1,1\n" + stampText(1) + ",oops,1\n";
    REQUIRE_THROWS_AS(loadText(store, track, broken), io::ParseError);

    REQUIRE(store.size() == 0);
    REQUIRE_FALSE(store.hasData());
    REQUIRE_FALSE(track.hasData());
    REQUIRE(track.size() == 0);
    REQUIRE(store.firstStamp() == "...");
}

TEST_CASE("SensorStore unload drops records, edits and GPS runs", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    loadText(store, track, sequentialFile(20));
    REQUIRE(store.annotate("walk"));
    REQUIRE(track.markWindowInvalid());

    store.unload(track);

    REQUIRE(store.size() == 0);
    REQUIRE_FALSE(store.hasData());
    REQUIRE_FALSE(store.isDirty());
    REQUIRE(store.knownLabels().empty());
    REQUIRE_FALSE(track.hasData());
    REQUIRE_FALSE(track.isDirty());
    REQUIRE(track.size() == 0);
}

TEST_CASE("SensorStore feeds the GPS track while loading", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    loadText(store, track, sequentialFile(35));

    REQUIRE(track.size() == 4);
    REQUIRE(track.run(0).count == 10);
    REQUIRE(track.run(3).first_row_index == 30);
    REQUIRE(track.run(3).last_row_index == 34);
}

TEST_CASE("SensorStore reports load progress every thousand rows", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    Recorder recorder;
    loadText(store, track, sequentialFile(2500), recorder.callbacks());

    REQUIRE(recorder.messages.size() == 3);
    REQUIRE(recorder.messages[0] == "Loading file...\n0 rows loaded\nAt stamp: " + stampText(0));
    REQUIRE(recorder.messages[2] == "Loading file...\n2000 rows loaded\nAt stamp: " + stampText(2000));
    REQUIRE(recorder.completions == 1);
}

TEST_CASE("SensorStore annotates the current window", "[SensorStore]")
{
    data::SensorStore store({3, 1, 1});
    gps::GpsTrack track;
    loadText(store, track, sequentialFile(6));

    REQUIRE(store.cursor().stepForward());
    REQUIRE(store.annotate("walk"));
    REQUIRE_FALSE(store.labelAt(0).has_value());
    REQUIRE(store.labelAt(1) == std::optional<std::string>("walk"));
    REQUIRE(store.labelAt(3) == std::optional<std::string>("walk"));
    REQUIRE_FALSE(store.labelAt(4).has_value());
    REQUIRE(store.isDirty());
    REQUIRE(store.knownLabels().count("walk") == 1);

    REQUIRE_FALSE(store.annotate(""));

    REQUIRE(store.removeAnnotation());
    REQUIRE_FALSE(store.labelAt(2).has_value());
}

TEST_CASE("SensorStore annotates explicit windows inclusively", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    loadText(store, track, sequentialFile(6));

    REQUIRE(store.annotate(data::DataWindow{2, 4, "run"}));
    REQUIRE_FALSE(store.labelAt(1).has_value());
    REQUIRE(store.labelAt(2) == std::optional<std::string>("run"));
    REQUIRE(store.labelAt(4) == std::optional<std::string>("run"));
    REQUIRE_FALSE(store.labelAt(5).has_value());

    REQUIRE(store.removeAnnotation(data::DataWindow{4, 4, {}}));
    REQUIRE_FALSE(store.labelAt(4).has_value());
    REQUIRE(store.labelAt(3) == std::optional<std::string>("run"));

    REQUIRE_FALSE(store.annotate(data::DataWindow{4, 6, "run"}));
    REQUIRE_FALSE(store.annotate(data::DataWindow{3, 2, "run"}));
}

TEST_CASE("SensorStore edits do nothing before data is loaded", "[SensorStore]")
{
    data::SensorStore store;
    REQUIRE_FALSE(store.annotate("walk"));
    REQUIRE_FALSE(store.removeAnnotation());
    REQUIRE_FALSE(store.addNote("note"));
    REQUIRE_FALSE(store.annotate(data::DataWindow{0, 0, "walk"}));
    REQUIRE_FALSE(store.isDirty());

    const auto summary = store.labelText(7, std::chrono::minutes{5});
    REQUIRE(summary.size() == 1);
    REQUIRE(summary[0].kind == data::SummaryEntryKind::Ellipsis);
    REQUIRE(store.currentStamp() == "...");
}

TEST_CASE("SensorStore attaches notes to the last row of the window", "[SensorStore]")
{
    data::SensorStore store({4, 1, 1});
    gps::GpsTrack track;
    loadText(store, track, sequentialFile(10));

    REQUIRE(store.addNote("dropped the watch"));
    REQUIRE(store.noteAt(3) == std::optional<std::string>("dropped the watch"));
    REQUIRE_FALSE(store.noteAt(2).has_value());
    REQUIRE(store.isDirty());

    REQUIRE(store.addNote(""));
    REQUIRE_FALSE(store.noteAt(3).has_value());
}

TEST_CASE("SensorStore seeds known labels from the file", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    loadText(store, track, labelledFile({"sit", "", "walk", "sit"}));

    REQUIRE(store.knownLabels() == std::set<std::string>{"sit", "walk"});
    REQUIRE(store.schema().hasActivityLabel);
}

TEST_CASE("SensorStore does not write when nothing changed", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    loadText(store, track, sequentialFile(5));

    CountingSink sink;
    Recorder recorder;
    REQUIRE_FALSE(store.save(sink, recorder.callbacks()));
    REQUIRE(sink.headers == 0);
    REQUIRE(sink.rows == 0);
    REQUIRE(recorder.messages == std::vector<std::string>{"No changes to sensor data, nothing to save"});
    REQUIRE(recorder.completions == 1);
}

TEST_CASE("SensorStore writes every record and reports percentages", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    loadText(store, track, sequentialFile(1200));
    store.markDirty();

    CountingSink sink;
    Recorder recorder;
    REQUIRE(store.save(sink, recorder.callbacks()));
    REQUIRE(sink.headers == 1);
    REQUIRE(sink.rows == 1200);
    REQUIRE(sink.finishes == 1);
    REQUIRE(recorder.messages == std::vector<std::string>{"Saving to data file...\nAt 0.0% of the data...",
                                                          "Saving to data file...\nAt 41.6% of the data...",
                                                          "Saving to data file...\nAt 83.3% of the data..."});
    REQUIRE(recorder.completions == 1);
    REQUIRE_FALSE(store.isDirty());
}

TEST_CASE("SensorStore save then load reproduces the records", "[SensorStore]")
{
    data::SensorStore store({2, 1, 1});
    gps::GpsTrack track;
    loadText(store, track, "stamp,latitude,longitude,comment\ndt,f,f,s\n" +
                               stampText(0) + ",47.1,8.5,\"a, b\"\n" +
                               stampText(1) + ",,,\n" +
                               stampText(2) + ",47.2,8.5,c\n");
    REQUIRE(store.annotate("walk"));
    REQUIRE(store.addNote("line one\nline two"));
    REQUIRE(store.setGpsValid(2, 2, false));

    std::ostringstream out;
    io::TabularWriter writer(out);
    REQUIRE(store.save(writer));

    data::SensorStore reloaded;
    gps::GpsTrack reloadedTrack;
    loadText(reloaded, reloadedTrack, out.str());

    REQUIRE(reloaded.schema().columns == store.schema().columns);
    REQUIRE(reloaded.schema().hasNotes);
    REQUIRE(reloaded.size() == store.size());
    for (std::size_t i = 0; i < store.size(); ++i)
        REQUIRE(reloaded.record(i) == store.record(i));

    REQUIRE_FALSE(reloaded.isGpsValid(2));
    REQUIRE_FALSE(reloadedTrack.run(1).is_valid);
}

TEST_CASE("SensorStore keeps float validity columns numeric", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    loadText(store, track, "stamp,is_gps_valid\ndt,f\n" + stampText(0) + ",1\n" + stampText(1) + ",0\n");

    REQUIRE(store.isGpsValid(0));
    REQUIRE_FALSE(store.isGpsValid(1));

    REQUIRE(store.setGpsValid(0, 1, false));
    REQUIRE(std::get<double>(*store.value(0, "is_gps_valid")) == 0.0);
    REQUIRE_FALSE(store.setGpsValid(1, 2, true));
}

TEST_CASE("SensorStore reports window stamps", "[SensorStore]")
{
    data::SensorStore store({3, 1, 2});
    gps::GpsTrack track;
    loadText(store, track, sequentialFile(10));

    REQUIRE(store.firstStamp() == stampText(2));
    REQUIRE(store.currentStamp() == stampText(2));
    REQUIRE(store.lastStamp() == stampText(9));

    REQUIRE(store.cursor().stepForward());
    REQUIRE(store.currentStamp() == stampText(4));
    REQUIRE(store.firstStamp() == stampText(2));
}

TEST_CASE("SensorStore summarises labels around an anchor", "[SensorStore]")
{
    data::SensorStore store;
    gps::GpsTrack track;
    //                              0    1    2   3    4    5    6    7   8   9
    loadText(store, track, labelledFile({"a", "a", "", "b", "b", "b", "c", "", "", ""}));
    const auto horizon = std::chrono::minutes{5};

    SECTION("runs are taken outwards while they fit")
    {
        const auto summary = store.labelTextAt(4, 7, horizon);
        REQUIRE(summary.size() == 6);

        REQUIRE(summary[0].kind == data::SummaryEntryKind::Value);
        REQUIRE(summary[0].text == std::optional<std::string>("a"));
        REQUIRE(summary[0].row_index == 0);
        REQUIRE(summary[1].kind == data::SummaryEntryKind::Ellipsis);
        REQUIRE(summary[1].row_index == 1);
        REQUIRE_FALSE(summary[2].text.has_value());
        REQUIRE(summary[2].row_index == 2);
        REQUIRE(summary[3].text == std::optional<std::string>("b"));
        REQUIRE(summary[3].is_anchor);
        REQUIRE(summary[3].stamp == kBase + std::chrono::seconds{3});
        REQUIRE(summary[4].kind == data::SummaryEntryKind::Ellipsis);
        REQUIRE(summary[4].row_index == 5);
        REQUIRE(summary[5].text == std::optional<std::string>("c"));
        REQUIRE_FALSE(summary[5].is_anchor);
    }

    SECTION("a side that no longer fits stops")
    {
        const auto summary = store.labelTextAt(4, 3, horizon);
        REQUIRE(summary.size() == 3);
        REQUIRE(summary[0].row_index == 2);
        REQUIRE(summary[1].text == std::optional<std::string>("b"));
        REQUIRE(summary[2].kind == data::SummaryEntryKind::Ellipsis);
    }

    SECTION("the anchor value is kept when nothing else fits")
    {
        for (std::size_t lines : {std::size_t{0}, std::size_t{1}})
        {
            const auto summary = store.labelTextAt(4, lines, horizon);
            REQUIRE(summary.size() == 1);
            REQUIRE(summary[0].text == std::optional<std::string>("b"));
            REQUIRE(summary[0].is_anchor);
        }
    }

    SECTION("the horizon limits the scanned rows")
    {
        const auto summary = store.labelTextAt(4, 7, std::chrono::seconds{1});
        REQUIRE(summary.size() == 2);
        REQUIRE(summary[0].row_index == 3);
        REQUIRE(summary[1].row_index == 5);
    }

    SECTION("the window form anchors on the last row")
    {
        const auto summary = store.labelText(data::DataWindow{0, 6, {}}, 1, horizon);
        REQUIRE(summary.size() == 1);
        REQUIRE(summary[0].text == std::optional<std::string>("c"));
    }
}

TEST_CASE("SensorStore summarises notes like labels", "[SensorStore]")
{
    data::SensorStore store({2, 1, 1});
    gps::GpsTrack track;
    loadText(store, track, sequentialFile(4));
    REQUIRE(store.addNote("first"));
    REQUIRE(store.cursor().stepForward());
    REQUIRE(store.cursor().stepForward());
    REQUIRE(store.addNote("second"));

    const auto summary = store.noteText(5, std::chrono::minutes{1});
    REQUIRE(summary.size() == 4);
    REQUIRE_FALSE(summary[0].text.has_value());
    REQUIRE(summary[1].text == std::optional<std::string>("first"));
    REQUIRE_FALSE(summary[2].text.has_value());
    REQUIRE(summary[3].text == std::optional<std::string>("second"));
    REQUIRE(summary[3].is_anchor);
}
