#ifndef TST_IMAGELOADER_H
#define TST_IMAGELOADER_H

#include <QObject>

class ImageLoaderTest : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void largeImagesAreScaledDown();
    void smallImagesKeepTheirSize();
    void alphaIsFlattenedOntoWhite();
    void undecodablePayloadFails();
    void localFilesResolve();
    void unsupportedSchemesFail();
    void userInputUrls();
};

#endif // TST_IMAGELOADER_H
