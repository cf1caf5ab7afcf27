#include "preferencesdialog.h"
#include "services/butlersettings.h"
#include "services/destinationresolver.h"
#include "services/mediametadataextractor.h"

#include <QVBoxLayout>
#include <QFormLayout>
#include <QGroupBox>
#include <QDialogButtonBox>
#include <QMessageBox>

PreferencesDialog::PreferencesDialog(QWidget *parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Preferences"));
    setupUi();
    loadSettings();
}

PreferencesDialog::~PreferencesDialog() = default;

void PreferencesDialog::setupUi()
{
    auto *mainLayout = new QVBoxLayout(this);

    // Destination layout group
    auto *destinationGroup = new QGroupBox(tr("Destination"));
    auto *destinationLayout = new QFormLayout(destinationGroup);

    layoutCombo_ = new QComboBox();
    layoutCombo_->addItem(tr("Folder per title"),
        DestinationResolver::layoutToString(DestinationLayout::LabelFolder));
    layoutCombo_->addItem(tr("Media library (Movies / Series / Season)"),
        DestinationResolver::layoutToString(DestinationLayout::Library));
    connect(layoutCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &PreferencesDialog::updateLayoutExample);
    destinationLayout->addRow(tr("Layout:"), layoutCombo_);

    layoutExampleLabel_ = new QLabel();
    layoutExampleLabel_->setWordWrap(true);
    destinationLayout->addRow(tr("Example:"), layoutExampleLabel_);

    mainLayout->addWidget(destinationGroup);

    // Media group
    auto *mediaGroup = new QGroupBox(tr("Media Files"));
    auto *mediaLayout = new QFormLayout(mediaGroup);

    extensionsEdit_ = new QLineEdit();
    extensionsEdit_->setPlaceholderText(MediaMetadataExtractor::defaultVideoExtensions().join(", "));
    extensionsEdit_->setToolTip(tr("File types queued when adding folders or monitoring"));
    mediaLayout->addRow(tr("Video extensions:"), extensionsEdit_);

    mainLayout->addWidget(mediaGroup);

    // Monitor group
    auto *monitorGroup = new QGroupBox(tr("Folder Monitor"));
    auto *monitorLayout = new QFormLayout(monitorGroup);

    pollIntervalSpin_ = new QSpinBox();
    pollIntervalSpin_->setRange(500, 600000);
    pollIntervalSpin_->setSingleStep(500);
    pollIntervalSpin_->setSuffix(tr(" ms"));
    monitorLayout->addRow(tr("Poll interval:"), pollIntervalSpin_);

    mainLayout->addWidget(monitorGroup);

    // Buttons
    mainLayout->addStretch();

    auto *buttonBox = new QDialogButtonBox(
        QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &PreferencesDialog::onAccept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttonBox);

    setMinimumWidth(420);
}

void PreferencesDialog::loadSettings()
{
    const ButlerSettings settings = ButlerSettings::load();

    int layoutIndex = layoutCombo_->findData(DestinationResolver::layoutToString(settings.layout));
    if (layoutIndex >= 0) {
        layoutCombo_->setCurrentIndex(layoutIndex);
    }
    updateLayoutExample();

    extensionsEdit_->setText(settings.videoExtensions.join(", "));
    pollIntervalSpin_->setValue(settings.pollIntervalMs);
}

void PreferencesDialog::saveSettings()
{
    ButlerSettings settings = ButlerSettings::load();
    settings.layout = DestinationResolver::layoutFromString(layoutCombo_->currentData().toString());

    QStringList extensions = ButlerSettings::parseExtensions(extensionsEdit_->text());
    if (extensions.isEmpty()) {
        extensions = MediaMetadataExtractor::defaultVideoExtensions();
    }
    settings.videoExtensions = extensions;
    settings.pollIntervalMs = pollIntervalSpin_->value();

    settings.save();
}

void PreferencesDialog::updateLayoutExample()
{
    const DestinationLayout layout =
        DestinationResolver::layoutFromString(layoutCombo_->currentData().toString());
    const DestinationResolver resolver(layout);

    const QString movie = QStringLiteral("movie.2020.1080p.mkv");
    const QString episode = QStringLiteral("Show.Name.S01E02.720p.mkv");
    const DestinationPlan moviePlan = resolver.plan(movie);
    const DestinationPlan episodePlan = resolver.plan(episode);

    layoutExampleLabel_->setText(QString("%1\n%2")
        .arg(moviePlan.folder + "/" + moviePlan.fileName,
             episodePlan.folder + "/" + episodePlan.fileName));
}

void PreferencesDialog::onAccept()
{
    if (!extensionsEdit_->text().trimmed().isEmpty()
        && ButlerSettings::parseExtensions(extensionsEdit_->text()).isEmpty()) {
        QMessageBox::warning(this, tr("Preferences"),
                             tr("Enter at least one file extension."));
        return;
    }

    saveSettings();
    accept();
}
