#include "TextMeasurer.hpp"
#include <QFont>
#include <QFontMetricsF>
#include <QString>

namespace lf {

QFont QtTextMeasurer::toQFont(const FontSpec& font) {
    QFont qfont(QString::fromStdString(font.family));
    qfont.setPixelSize(static_cast<int>(font.pixelSize));
    qfont.setBold(font.bold);
    return qfont;
}

TextMetrics QtTextMeasurer::measure(std::string_view text,
                                    const FontSpec& font) const {
    QFontMetricsF fm(toQFont(font));
    QString str = QString::fromUtf8(text.data(), static_cast<int>(text.size()));

    TextMetrics m;
    m.width = static_cast<f32>(fm.horizontalAdvance(str));
    m.height = static_cast<f32>(fm.height());
    m.ascent = static_cast<f32>(fm.ascent());
    return m;
}

} // namespace lf
