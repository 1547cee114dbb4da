#ifndef TST_REPORTINPUTREADER_H
#define TST_REPORTINPUTREADER_H

#include <QObject>

class ReportInputReaderTest : public QObject
{
    Q_OBJECT
private slots:
    void readsSnapshotFile();
    void emptySupportSlotIsNotRendered();
    void namelessSupportAgentIsUnassigned();
    void rejectsNonObjectDocuments();
    void parsesStoreTimestamps_data();
    void parsesStoreTimestamps();
    void serviceTypeKeys();
};

#endif // TST_REPORTINPUTREADER_H
