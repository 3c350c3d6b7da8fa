#ifndef PHOTO_TABLE_MODEL_HPP
#define PHOTO_TABLE_MODEL_HPP

#include <QAbstractTableModel>
#include <QString>
#include <QVariant>

class PhotoCollection;

/**
 * @brief Read-only table view of a PhotoCollection.
 *
 * Edits go through PhotoCollection::apply_custom_description(); call
 * refresh() after any pass or edit so attached views redraw.
 */
class PhotoTableModel : public QAbstractTableModel
{
public:
    enum Column {
        StatusColumn = 0,
        CustomizedColumn,
        DescriptionColumn,
        ColumnCount
    };

    explicit PhotoTableModel(const PhotoCollection& collection, QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;

    void refresh();

    static QString status_label(int status);

private:
    const PhotoCollection& collection;
};

#endif
