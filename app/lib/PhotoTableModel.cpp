#include "PhotoTableModel.hpp"
#include "PhotoCollection.hpp"


PhotoTableModel::PhotoTableModel(const PhotoCollection& collection, QObject* parent)
    : QAbstractTableModel(parent),
      collection(collection)
{
}


int PhotoTableModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(collection.size());
}


int PhotoTableModel::columnCount(const QModelIndex& parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return ColumnCount;
}


QString PhotoTableModel::status_label(int status)
{
    switch (static_cast<PhotoStatus>(status)) {
        case PhotoStatus::Saved: return QStringLiteral("Saved");
        case PhotoStatus::Ready: return QString();
        case PhotoStatus::WarningLength: return QStringLiteral("Long name");
        case PhotoStatus::ErrorMinor: return QStringLiteral("Error");
        case PhotoStatus::RefuseLength: return QStringLiteral("Invalid length");
        case PhotoStatus::RefuseSymbol: return QStringLiteral("Invalid symbol");
        case PhotoStatus::RefuseDuplicate: return QStringLiteral("Duplicate");
        case PhotoStatus::ErrorSevere: return QStringLiteral("Failed");
        default: return QString();
    }
}


QVariant PhotoTableModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= rowCount()) {
        return {};
    }

    const Photo& photo = collection.at(static_cast<std::size_t>(index.row()));

    if (role == Qt::DisplayRole) {
        switch (index.column()) {
            case StatusColumn:
                return status_label(static_cast<int>(photo.status()));
            case CustomizedColumn:
                return photo.is_customized() ? QStringLiteral("Edited") : QString();
            case DescriptionColumn:
                return QString::fromStdString(photo.description());
            default:
                return {};
        }
    }

    if (role == Qt::ToolTipRole && index.column() == DescriptionColumn) {
        return QStringLiteral("%1\n%2")
            .arg(QString::fromStdString(photo.original_description()),
                 QString::fromStdString(photo.source_url()));
    }

    if (role == Qt::UserRole && index.column() == StatusColumn) {
        return static_cast<int>(photo.status());
    }

    return {};
}


QVariant PhotoTableModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation != Qt::Horizontal || role != Qt::DisplayRole) {
        return {};
    }
    if (section == DescriptionColumn) {
        return QStringLiteral("Photo Descriptions");
    }
    return QString();
}


Qt::ItemFlags PhotoTableModel::flags(const QModelIndex& index) const
{
    if (!index.isValid()) {
        return Qt::NoItemFlags;
    }
    return Qt::ItemIsEnabled | Qt::ItemIsSelectable;
}


void PhotoTableModel::refresh()
{
    beginResetModel();
    endResetModel();
}
