#include <gtest/gtest.h>
#include <QFile>
#include <QTemporaryDir>
#include <QVariantList>
#include "BioEngine.h"
#include "BioImport.h"

using namespace BioEngine;

namespace {

QString writeFile(const QTemporaryDir &dir, const QString &name, const QByteArray &content)
{
    const QString path = dir.filePath(name);
    QFile f(path);
    if (f.open(QIODevice::WriteOnly))
        f.write(content);
    return path;
}

} // namespace

// =========================================================
// Helpers
// =========================================================

TEST(ImportKey, NormalizesCaseAndUnderscores)
{
    EXPECT_EQ(normalizeImportKey("Plastic_Shreds"), QString("plastic shreds"));
    EXPECT_EQ(normalizeImportKey("DRY_LEAVES_kg"), QString("dry leaves kg"));
    EXPECT_EQ(normalizeImportKey("E-waste"), QString("e-waste"));
}

TEST(ImportKey, MatchesBySubstringOrFirstToken)
{
    // Метка содержит ключ
    EXPECT_TRUE(labelMatchesKey("Plastic shreds", "plastic shreds"));
    EXPECT_TRUE(labelMatchesKey("Dry leaves", "leaves"));
    EXPECT_TRUE(labelMatchesKey("Straws / fibers", "straws"));
    // Ключ содержит первое слово метки
    EXPECT_TRUE(labelMatchesKey("Plastic shreds", "plastic bottles"));
    EXPECT_TRUE(labelMatchesKey("Vegetable peels", "fresh vegetable waste"));

    EXPECT_FALSE(labelMatchesKey("Plastic shreds", "glass"));
    EXPECT_FALSE(labelMatchesKey("E-waste", "e waste"));
}

TEST(ImportValue, CoercesNumbersAndNumericStrings)
{
    double v{0.0};
    EXPECT_TRUE(coerceQuantity(QVariant(3.5), v));
    EXPECT_DOUBLE_EQ(v, 3.5);
    EXPECT_TRUE(coerceQuantity(QVariant(7), v));
    EXPECT_DOUBLE_EQ(v, 7.0);
    EXPECT_TRUE(coerceQuantity(QVariant(qlonglong(12)), v));
    EXPECT_DOUBLE_EQ(v, 12.0);
    EXPECT_TRUE(coerceQuantity(QVariant(QString(" 4.25 ")), v));
    EXPECT_DOUBLE_EQ(v, 4.25);
}

TEST(ImportValue, RejectsNonNumeric)
{
    double v{-1.0};
    EXPECT_FALSE(coerceQuantity(QVariant(), v));
    EXPECT_FALSE(coerceQuantity(QVariant(QString("lots")), v));
    EXPECT_FALSE(coerceQuantity(QVariant(QString("")), v));
    EXPECT_FALSE(coerceQuantity(QVariant(true), v));
    EXPECT_FALSE(coerceQuantity(QVariant(QVariantList{1, 2}), v));
    EXPECT_DOUBLE_EQ(v, -1.0);
}

TEST(ImportJson, ParsesObject)
{
    QVariantMap out{};
    QString err{};
    ASSERT_TRUE(parseQuantityJson(R"({"sawdust": 6, "sand": "0.8"})", out, &err));
    EXPECT_EQ(out.size(), 2);
    EXPECT_DOUBLE_EQ(out.value("sawdust").toDouble(), 6.0);
}

TEST(ImportJson, RejectsArraysAndBrokenText)
{
    QVariantMap out{};
    QString err{};
    EXPECT_FALSE(parseQuantityJson("[1, 2, 3]", out, &err));
    EXPECT_FALSE(err.isEmpty());

    err.clear();
    EXPECT_FALSE(parseQuantityJson("{\"sand\": ", out, &err));
    EXPECT_FALSE(err.isEmpty());
}

// =========================================================
// Engine import
// =========================================================

class EngineImportTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        QObject::connect(&engine, &ConversionEngine::stateChanged, [this]() { ++notifications; });
    }

    ConversionEngine engine;
    int notifications{0};
};

TEST_F(EngineImportTest, UnderscoreKeyUpdatesOnlyMatchingLabel)
{
    const auto before = engine.orderedEntries();

    ImportSummary s = engine.importQuantities({{"plastic_shreds", 3.5}});
    EXPECT_EQ(s.applied, 1);
    EXPECT_EQ(notifications, 1);

    const auto after = engine.orderedEntries();
    for (int i = 0; i < after.size(); ++i) {
        if (after[i].label == "Plastic shreds")
            EXPECT_DOUBLE_EQ(after[i].quantity, 3.5);
        else
            EXPECT_DOUBLE_EQ(after[i].quantity, before[i].quantity);
    }
}

TEST_F(EngineImportTest, UnknownKeyLeavesRegistryUnchanged)
{
    const double total = engine.totalAvailableWaste();

    ImportSummary s = engine.importQuantities({{"unknown_material_xyz", 9.0}});
    EXPECT_EQ(s.applied, 0);
    EXPECT_EQ(s.unmatched, 1);
    EXPECT_DOUBLE_EQ(engine.totalAvailableWaste(), total);
    EXPECT_DOUBLE_EQ(engine.value("Other"), 0.3);
}

TEST_F(EngineImportTest, MalformedValueIsSkippedOthersApplied)
{
    QVariantMap source{{"sawdust", QString("n/a")}, {"sand", QString("1.5")}, {"Dry leaves", 2}};

    ImportSummary s = engine.importQuantities(source);
    EXPECT_EQ(s.applied, 2);
    EXPECT_EQ(s.malformed, 1);
    EXPECT_DOUBLE_EQ(engine.value("Sawdust"), 5.0);
    EXPECT_DOUBLE_EQ(engine.value("Sand"), 1.5);
    EXPECT_DOUBLE_EQ(engine.value("Dry leaves"), 2.0);
    EXPECT_EQ(notifications, 1);
}

TEST_F(EngineImportTest, GenericKeyMayMatchSeveralLabels)
{
    // "s" входит в каждую метку, кроме "Other"
    ImportSummary s = engine.importQuantities({{"s", 1.0}});
    EXPECT_EQ(s.applied, 7);
    EXPECT_DOUBLE_EQ(engine.value("Sawdust"), 1.0);
    EXPECT_DOUBLE_EQ(engine.value("E-waste"), 1.0);
    EXPECT_DOUBLE_EQ(engine.value("Other"), 0.3);
}

TEST_F(EngineImportTest, NegativeImportIsClamped)
{
    engine.importQuantities({{"SAND", -4.0}});
    EXPECT_DOUBLE_EQ(engine.value("Sand"), 0.0);
}

TEST_F(EngineImportTest, ImportsJsonFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = writeFile(dir,
                                   "data.json",
                                   R"({"vegetable_peels": 10, "straws": "2.5", "glass": 4})");

    ImportSummary s{};
    ASSERT_TRUE(engine.importFile(path, &s));
    EXPECT_EQ(s.applied, 2);
    EXPECT_EQ(s.unmatched, 1);
    EXPECT_DOUBLE_EQ(engine.value("Vegetable peels"), 10.0);
    EXPECT_DOUBLE_EQ(engine.value("Straws / fibers"), 2.5);
}

TEST_F(EngineImportTest, FailedFileImportReportsErrorAndKeepsState)
{
    QStringList errors{};
    QObject::connect(&engine, &ConversionEngine::errorOccurred, [&errors](QString msg) {
        errors.append(msg);
    });

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString broken = writeFile(dir, "broken.json", "{\"sand\": 1,");

    EXPECT_FALSE(engine.importFile(broken));
    EXPECT_FALSE(engine.importFile(dir.filePath("missing.json")));
    EXPECT_EQ(errors.size(), 2);
    EXPECT_EQ(notifications, 0);
    EXPECT_DOUBLE_EQ(engine.totalAvailableWaste(), 21.0);
}
