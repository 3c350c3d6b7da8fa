#include <catch2/catch_test_macros.hpp>
#include "PhotoCollection.hpp"
#include "PhotoTableModel.hpp"
#include "TestHelpers.hpp"

TEST_CASE("table model mirrors the collection") {
    QtCoreContext context;
    PhotoCollection collection(make_photos({"Barn", "Barn", "Silo"}));
    collection.process_descriptions(NamingConfig{});
    collection.apply_custom_description(2, "Silo: north side", NamingConfig{});

    PhotoTableModel model(collection);
    REQUIRE(model.rowCount() == 3);
    REQUIRE(model.columnCount() == PhotoTableModel::ColumnCount);

    const QModelIndex description = model.index(1, PhotoTableModel::DescriptionColumn);
    REQUIRE(model.data(description).toString() == QStringLiteral("Barn - 02"));
    REQUIRE(model.data(description, Qt::ToolTipRole).toString() ==
            QStringLiteral("Barn\nhttps://example.com/photo/1.jpg"));

    REQUIRE(model.data(model.index(0, PhotoTableModel::StatusColumn)).toString().isEmpty());
    REQUIRE(model.data(model.index(2, PhotoTableModel::StatusColumn)).toString() == QStringLiteral("Invalid symbol"));
    REQUIRE(model.data(model.index(2, PhotoTableModel::StatusColumn), Qt::UserRole).toInt() ==
            static_cast<int>(PhotoStatus::RefuseSymbol));
    REQUIRE(model.data(model.index(2, PhotoTableModel::CustomizedColumn)).toString() == QStringLiteral("Edited"));
    REQUIRE(model.data(model.index(0, PhotoTableModel::CustomizedColumn)).toString().isEmpty());
}

TEST_CASE("table model is read-only") {
    QtCoreContext context;
    PhotoCollection collection(make_photos({"Barn"}));
    PhotoTableModel model(collection);

    const Qt::ItemFlags flags = model.flags(model.index(0, PhotoTableModel::DescriptionColumn));
    REQUIRE(flags.testFlag(Qt::ItemIsEnabled));
    REQUIRE_FALSE(flags.testFlag(Qt::ItemIsEditable));
    REQUIRE_FALSE(model.setData(model.index(0, PhotoTableModel::DescriptionColumn), QStringLiteral("Shed")));
    REQUIRE(model.headerData(PhotoTableModel::DescriptionColumn, Qt::Horizontal).toString() ==
            QStringLiteral("Photo Descriptions"));
}

TEST_CASE("refresh signals a reset after a pass") {
    QtCoreContext context;
    PhotoCollection collection(make_photos({"Barn"}));
    PhotoTableModel model(collection);

    int resets = 0;
    QObject::connect(&model, &QAbstractItemModel::modelReset, [&resets]() { ++resets; });
    collection.process_descriptions(NamingConfig{});
    model.refresh();
    REQUIRE(resets == 1);
    REQUIRE(model.data(model.index(0, PhotoTableModel::DescriptionColumn)).toString() == QStringLiteral("Barn - 01"));
}
