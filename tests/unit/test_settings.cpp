#include <catch2/catch_test_macros.hpp>

#include "app/settings.hpp"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace blockmark;
using namespace blockmark::app;

namespace {

QString write_file(const QTemporaryDir& dir, const QString& name, const QByteArray& content) {
    const auto path = dir.filePath(name);
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(content);
    return path;
}

} // namespace

TEST_CASE("Settings: defaults without a file", "[settings]") {
    const auto settings = load_settings(QString{});
    REQUIRE(settings.is_ok());
    REQUIRE(settings.unwrap().front_matter == FrontMatterHandling::Remove);
    REQUIRE(settings.unwrap().highlight_color == Color::YellowBackground);
    REQUIRE(settings.unwrap().asset_root.isEmpty());
    REQUIRE(settings.unwrap().log_file.isEmpty());
}

TEST_CASE("Settings: reads every key", "[settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = write_file(dir, QStringLiteral("blockmark.ini"),
                                 "[convert]\n"
                                 "frontMatter=keep-as-code\n"
                                 "highlightColor=green_background\n"
                                 "[assets]\n"
                                 "root=notes\n"
                                 "uploads=/srv/uploads.json\n"
                                 "[logging]\n"
                                 "file=logs/run.log\n");

    const auto settings = load_settings(path);
    REQUIRE(settings.is_ok());
    const auto& s = settings.unwrap();
    REQUIRE(s.front_matter == FrontMatterHandling::KeepAsCode);
    REQUIRE(s.highlight_color == Color::GreenBackground);
    REQUIRE(s.asset_root == QDir::cleanPath(dir.filePath(QStringLiteral("notes"))));
    REQUIRE(s.uploads_manifest == QStringLiteral("/srv/uploads.json"));
    REQUIRE(s.log_file == QDir::cleanPath(dir.filePath(QStringLiteral("logs/run.log"))));
}

TEST_CASE("Settings: errors", "[settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    SECTION("missing file") {
        const auto settings = load_settings(dir.filePath(QStringLiteral("absent.ini")));
        REQUIRE(settings.is_err());
        REQUIRE(settings.unwrap_err().kind == ErrorKind::Io);
    }

    SECTION("invalid front matter handling") {
        const auto path = write_file(dir, QStringLiteral("bad.ini"), "[convert]\nfrontMatter=drop\n");
        const auto settings = load_settings(path);
        REQUIRE(settings.is_err());
        REQUIRE(settings.unwrap_err().kind == ErrorKind::InvalidConfig);
    }

    SECTION("invalid color") {
        const auto path = write_file(dir, QStringLiteral("bad.ini"), "[convert]\nhighlightColor=neon\n");
        const auto settings = load_settings(path);
        REQUIRE(settings.is_err());
        REQUIRE(settings.unwrap_err().kind == ErrorKind::InvalidConfig);
    }
}
