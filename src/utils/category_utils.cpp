module;
#include <QRegularExpression>
#include <QString>
#include <QStringList>

module baran.utils.category_utils;

namespace baran::utils {

QString detectCategory(const QString& filePath)
{
    QString lower = filePath.toLower();
    const int cut = lower.indexOf(QRegularExpression(QStringLiteral("[?#]")));
    if (cut >= 0) lower = lower.left(cut);
    const int slash = lower.lastIndexOf('/');
    if (slash >= 0) lower = lower.mid(slash + 1);
    const int dot = lower.lastIndexOf('.');
    const QString ext = dot >= 0 ? lower.mid(dot + 1) : QString();

    const QStringList video = { "mp4", "mkv", "mov", "avi", "webm", "wmv", "flv", "m4v" };
    const QStringList audio = { "mp3", "wav", "aac", "flac", "m4a", "ogg", "opus" };
    const QStringList images = { "jpg", "jpeg", "png", "gif", "bmp", "webp", "svg", "tiff" };
    const QStringList archives = { "zip", "rar", "7z", "tar", "gz", "bz2", "xz", "tgz", "iso", "img" };
    const QStringList documents = { "pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx", "txt", "md" };
    const QStringList programs = { "dmg", "exe", "msi", "pkg", "deb", "rpm", "appimage", "vsix", "vspackage" };

    if (video.contains(ext)) return QStringLiteral("videos");
    if (audio.contains(ext)) return QStringLiteral("audios");
    if (images.contains(ext)) return QStringLiteral("images");
    if (archives.contains(ext)) return QStringLiteral("archives");
    if (documents.contains(ext)) return QStringLiteral("documents");
    if (programs.contains(ext)) return QStringLiteral("programs");
    return QStringLiteral("others");
}

QStringList categoryNames()
{
    return { "videos", "audios", "images", "archives", "documents", "programs", "playlists", "others" };
}

QString playlistCategory()
{
    return QStringLiteral("playlists");
}

} // namespace baran::utils
