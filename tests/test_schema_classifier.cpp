#include "MenderExceptions.h"
#include "SchemaClassifier.h"

#include <gtest/gtest.h>

TEST(SchemaClassifierTest, DeclaredNamesAreContinuous) {
    const std::vector<std::string> names = {"age", "grade", "group"};
    const auto roles = SchemaClassifier::classify(names, {"grade", "age"});

    ASSERT_EQ(roles.size(), names.size());
    EXPECT_EQ(roles[0], ColumnRole::CONTINUOUS);
    EXPECT_EQ(roles[1], ColumnRole::CONTINUOUS);
    EXPECT_EQ(roles[2], ColumnRole::CATEGORICAL);
}

TEST(SchemaClassifierTest, EmptyDeclarationMakesEverythingCategorical) {
    const auto roles = SchemaClassifier::classify({"a", "b"}, {});
    EXPECT_EQ(roles, (std::vector<ColumnRole>{ColumnRole::CATEGORICAL, ColumnRole::CATEGORICAL}));
}

TEST(SchemaClassifierTest, RepeatedDeclarationIsHarmless) {
    const auto roles = SchemaClassifier::classify({"a", "b"}, {"b", "b"});
    EXPECT_EQ(roles, (std::vector<ColumnRole>{ColumnRole::CATEGORICAL, ColumnRole::CONTINUOUS}));
}

TEST(SchemaClassifierTest, UnknownNamesAreReported) {
    try {
        SchemaClassifier::classify({"a", "b"}, {"a", "missing", "other", "missing"});
        FAIL() << "expected DataValidityException";
    } catch (const Mender::DataValidityException& e) {
        EXPECT_EQ(e.columns(), (std::vector<std::string>{"missing", "other"}));
    }
}

TEST(SchemaClassifierTest, NamesWithRoleKeepsColumnOrder) {
    const std::vector<std::string> names = {"x", "y", "z"};
    const std::vector<ColumnRole> roles = {ColumnRole::CONTINUOUS, ColumnRole::CATEGORICAL, ColumnRole::CONTINUOUS};
    EXPECT_EQ(SchemaClassifier::namesWithRole(names, roles, ColumnRole::CONTINUOUS),
              (std::vector<std::string>{"x", "z"}));
    EXPECT_EQ(SchemaClassifier::namesWithRole(names, roles, ColumnRole::CATEGORICAL),
              (std::vector<std::string>{"y"}));
}
